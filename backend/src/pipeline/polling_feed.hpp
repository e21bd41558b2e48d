#pragma once
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "md/book_events.hpp"
#include "md/exchange_feed.hpp"
#include "venues/rest_client.hpp"

// Feed for exchanges that only expose depth over REST. Every poll is a full,
// unsequenced snapshot, so resync() just pulls the next poll forward.
template <typename ParserT>
class PollingFeed final : public IExchangeFeed {
public:
    PollingFeed(Exchange exchange, Ticker ticker, std::string url,
                std::chrono::milliseconds interval, RestClient rest = RestClient{})
    : exchange_(exchange)
    , ticker_(std::move(ticker))
    , url_(std::move(url))
    , interval_(interval)
    , rest_(std::move(rest))
    , parser_(ticker_) {}

    void connect() override {
        pending_ = parser_.parse_snapshot(rest_.get(url_));
        next_poll_ = std::chrono::steady_clock::now() + interval_;
    }

    bool next(std::vector<BookEvent>& out, std::chrono::milliseconds timeout) override {
        if (pending_) {
            out.emplace_back(std::move(*pending_));
            pending_.reset();
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now < next_poll_) {
            const auto wait = std::min<std::chrono::steady_clock::duration>(next_poll_ - now, timeout);
            std::this_thread::sleep_for(wait);
            if (std::chrono::steady_clock::now() < next_poll_) return false;
        }

        next_poll_ = std::chrono::steady_clock::now() + interval_;
        out.emplace_back(parser_.parse_snapshot(rest_.get(url_)));
        return true;
    }

    void resync() override {
        next_poll_ = std::chrono::steady_clock::now();
    }

    void close() noexcept override {
        pending_.reset();
    }

    Exchange exchange() const override { return exchange_; }
    const Ticker& ticker() const override { return ticker_; }

private:
    Exchange exchange_;
    Ticker ticker_;
    std::string url_;
    std::chrono::milliseconds interval_;
    RestClient rest_;
    ParserT parser_;

    std::optional<BookSnapshot> pending_;
    std::chrono::steady_clock::time_point next_poll_{};
};
