#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "book_events.hpp"
#include "exchange.hpp"
#include "symbol_codec.hpp"

// Pull-based live book stream for one symbol on one exchange.
// Every failure (connect, disconnect, malformed payload, stale stream) is
// reported by throwing FeedError; the owning Collector decides to reconnect.
struct IExchangeFeed {
    virtual ~IExchangeFeed() = default;

    // Open the connection and queue an initial full snapshot.
    virtual void connect() = 0;

    // Wait up to `timeout` for events; appends to `out` and returns true if
    // any were produced, false on timeout.
    virtual bool next(std::vector<BookEvent>& out, std::chrono::milliseconds timeout) = 0;

    // Request a fresh full snapshot; the next events returned by next()
    // start with a BookSnapshot that rebases the book.
    virtual void resync() = 0;

    // Release the connection. Safe to call more than once.
    virtual void close() noexcept = 0;

    virtual Exchange exchange() const = 0;
    virtual const Ticker& ticker() const = 0;
};
