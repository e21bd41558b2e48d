#include "md/book.hpp"
#include "md/exchange_feed.hpp"
#include "util/errors.hpp"
#include "venues/venue_registry.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

// Streams one live Binance book for a few seconds and prints the top of book.
int main(int argc, char** argv) {
    const std::string symbol = argc > 1 ? argv[1] : "BTC_USDT";
    auto ticker = Ticker::parse(symbol);
    if (!ticker) {
        std::cerr << "Invalid symbol format: " << symbol << std::endl;
        return 1;
    }

    const VenueFactory* factory = VenueRegistry::instance().find(Exchange::Binance);
    auto feed = factory->make_feed(*ticker, FeedSettings{});
    Book book(symbol);

    try {
        feed->connect();
        const auto start = std::chrono::steady_clock::now();
        std::vector<BookEvent> evs;
        while (std::chrono::steady_clock::now() - start < std::chrono::seconds(5)) {
            evs.clear();
            if (!feed->next(evs, std::chrono::milliseconds(200))) continue;
            const auto r = book.apply_many(evs).result;
            if (r == ApplyResult::Anomaly || r == ApplyResult::Rejected) {
                std::cout << "anomaly: " << book.anomaly_reason() << ", resyncing\n";
                feed->resync();
                book.reset();
            }
            auto bid = book.best_bid();
            auto ask = book.best_ask();
            std::cout << symbol << " seq=" << book.last_seq()
                      << " bid=" << (bid ? bid->first : 0.0)
                      << " ask=" << (ask ? ask->first : 0.0)
                      << " state=" << to_string(book.state()) << "\n";
        }
    } catch (const FeedError& e) {
        std::cerr << "feed error: " << e.what() << std::endl;
        feed->close();
        return 1;
    }
    feed->close();
    std::cout << "Stopping after 5 seconds...\n";
    return 0;
}

/*
cmake -S . -B build && cmake --build build --target binance_smoke
./build/binance_smoke ETH_USDT
*/
