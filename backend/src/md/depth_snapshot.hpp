#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <optional>
#include <vector>
#include <utility>

// Order book state machine tags.
enum class BookState : uint8_t {
    Empty,      // no levels
    Partial,    // exactly one side populated
    Consistent, // both sides populated, best bid < best ask
    Anomalous   // crossed or out-of-sequence; needs reset + fresh snapshot
};

inline const char* to_string(BookState s) noexcept {
    switch (s) {
        case BookState::Empty:      return "EMPTY";
        case BookState::Partial:    return "PARTIAL";
        case BookState::Consistent: return "CONSISTENT";
        case BookState::Anomalous:  return "ANOMALOUS";
    }
    return "UNKNOWN";
}

inline std::optional<BookState> parse_book_state(std::string_view s) {
    if (s == "EMPTY")      return BookState::Empty;
    if (s == "PARTIAL")    return BookState::Partial;
    if (s == "CONSISTENT") return BookState::Consistent;
    if (s == "ANOMALOUS")  return BookState::Anomalous;
    return std::nullopt;
}

// Immutable point-in-time copy of one symbol's book, captured by the Collector
// and handed to the Persister.
struct DepthSnapshot {
    std::string symbol;   // canonical, e.g. "BTC_USDT"
    std::string exchange; // "BINANCE", "BITKUB"
    std::int64_t time_ms{0};
    std::uint64_t last_update_id{0};
    BookState state{BookState::Empty};

    // best-to-worse order
    std::vector<std::pair<double,double>> bids; // (price, size)
    std::vector<std::pair<double,double>> asks; // (price, size)

    bool operator==(const DepthSnapshot&) const = default;
};
