#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "md/exchange.hpp"
#include "md/symbol_codec.hpp"

struct IExchangeFeed;

// Per-collector feed tuning, filled from service settings.
struct FeedSettings {
    std::chrono::milliseconds poll_interval{0}; // 0 => exchange default
    std::chrono::seconds stale_after{std::chrono::seconds(30)};
    std::size_t depth{20};                      // levels persisted per side
};

struct VenueFactory {
    Exchange exchange{Exchange::Binance};
    std::string name;
    // Snapshot/poll cadence the exchange is collected at unless overridden.
    std::chrono::milliseconds default_interval{std::chrono::seconds(1)};
    std::function<std::unique_ptr<IExchangeFeed>(const Ticker& ticker, const FeedSettings& settings)> make_feed;
    std::function<std::string(const Ticker& ticker)> to_venue_symbol;
};
