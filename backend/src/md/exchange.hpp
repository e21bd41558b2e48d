#pragma once
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <cstdint>

// Closed set of supported exchanges. Chosen once at startup from Config.
enum class Exchange : uint8_t {
    Binance,
    Bitkub
};

inline const char* to_string(Exchange e) noexcept {
    switch (e) {
        case Exchange::Binance: return "BINANCE";
        case Exchange::Bitkub:  return "BITKUB";
    }
    return "UNKNOWN";
}

// Case-insensitive; "binance" and "BINANCE" both map to Exchange::Binance.
inline std::optional<Exchange> parse_exchange(std::string_view name) {
    std::string upper(name);
    for (auto& ch : upper) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    if (upper == "BINANCE") return Exchange::Binance;
    if (upper == "BITKUB")  return Exchange::Bitkub;
    return std::nullopt;
}
