#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "exchange.hpp"

// A trading pair "BASE_QUOTE", e.g. "BTC_USDT". Immutable, compared by value.
struct Ticker
{
    std::string base;
    std::string quote;

    // Returns nullopt unless `symbol` is "BASE_QUOTE" with both halves non-empty
    // and alphanumeric.
    static std::optional<Ticker> parse(std::string_view symbol);

    // Canonical form "BASE_QUOTE".
    std::string str() const { return base + "_" + quote; }

    bool operator==(const Ticker&) const = default;
};

struct SymbolCodec
{
    // Canonical ticker to the exchange's REST symbol: Binance "BTCUSDT", Bitkub "THB_BTC".
    static std::string to_venue(Exchange venue, const Ticker &ticker);
    // Stream name used in Binance websocket paths: "btcusdt".
    static std::string to_stream(Exchange venue, const Ticker &ticker);
};
