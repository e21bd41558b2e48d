#pragma once

#include <algorithm>

#include "venues/venue_factory.hpp"
#include "venues/rest_client.hpp"
#include "venues/binance/parser.hpp"
#include "venues/binance/ws.hpp"
#include "pipeline/stream_feed.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_binance_factory() {
    VenueFactory factory;
    factory.exchange = Exchange::Binance;
    factory.name = "BINANCE";
    factory.default_interval = std::chrono::seconds(1);
    factory.make_feed = [](const Ticker& ticker, const FeedSettings& settings) -> std::unique_ptr<IExchangeFeed> {
        using Feed = StreamFeed<BinanceWs, BinanceBookParser>;
        // The base snapshot must be deep enough to bridge the diff stream.
        const std::size_t limit = std::clamp<std::size_t>(settings.depth, 1000, 5000);
        const std::string url = "https://api.binance.com/api/v3/depth?symbol=" +
                                SymbolCodec::to_venue(Exchange::Binance, ticker) +
                                "&limit=" + std::to_string(limit);

        Feed::Options opts;
        opts.stream = SymbolCodec::to_stream(Exchange::Binance, ticker);
        opts.port = 9443;
        opts.stale_after = settings.stale_after;

        RestClient rest;
        return std::make_unique<Feed>(Exchange::Binance, ticker, std::move(opts),
                                      [rest, url] { return rest.get(url); });
    };
    factory.to_venue_symbol = [](const Ticker& ticker) {
        return SymbolCodec::to_venue(Exchange::Binance, ticker);
    };
    return factory;
}
