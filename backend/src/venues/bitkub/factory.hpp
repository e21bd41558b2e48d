#pragma once

#include "venues/venue_factory.hpp"
#include "venues/bitkub/parser.hpp"
#include "pipeline/polling_feed.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_bitkub_factory() {
    VenueFactory factory;
    factory.exchange = Exchange::Bitkub;
    factory.name = "BITKUB";
    factory.default_interval = std::chrono::seconds(2);
    factory.make_feed = [](const Ticker& ticker, const FeedSettings& settings) -> std::unique_ptr<IExchangeFeed> {
        const std::size_t limit = settings.depth;
        const std::string url = "https://api.bitkub.com/api/market/depth?sym=" +
                                SymbolCodec::to_venue(Exchange::Bitkub, ticker) +
                                "&lmt=" + std::to_string(limit);
        const auto interval = settings.poll_interval.count() > 0
            ? settings.poll_interval
            : std::chrono::milliseconds(std::chrono::seconds(2));
        return std::make_unique<PollingFeed<BitkubBookParser>>(Exchange::Bitkub, ticker, url, interval);
    };
    factory.to_venue_symbol = [](const Ticker& ticker) {
        return SymbolCodec::to_venue(Exchange::Bitkub, ticker);
    };
    return factory;
}
