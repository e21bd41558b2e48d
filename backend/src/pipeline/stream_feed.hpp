#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "md/book_events.hpp"
#include "md/exchange_feed.hpp"
#include "util/errors.hpp"
#include "util/spsc_ring.hpp"

// StreamFeed is parameterized by concrete Ws type and concrete Parser type.
// Each StreamFeed owns:
//  - a WS connector (producer thread lives in ws_thread_)
//  - an SPSC ring for raw frames
//  - a REST snapshot fetcher used for the base book and every resync
// The owning Collector thread is the single consumer: next() pops, parses
// and hands events back in arrival order. connect() fetches the initial
// snapshot only after the handshake (and, briefly, the first buffered diff),
// so buffered diffs can be bridged by sequence number.
template <typename WsT, typename ParserT, std::size_t QueuePow2 = 4096>
class StreamFeed final : public IExchangeFeed {
public:
    using SnapshotFetch = std::function<std::string()>;

    struct Options {
        std::string stream;   // venue stream name, e.g. "btcusdt"
        unsigned short port{443};
        std::chrono::seconds stale_after{std::chrono::seconds(30)};
        std::chrono::milliseconds open_timeout{std::chrono::seconds(10)};
        // After the handshake, wait this long for a first diff to be buffered
        // so the snapshot is newer than it.
        std::chrono::milliseconds first_frame_wait{std::chrono::seconds(1)};
    };

    StreamFeed(Exchange exchange, Ticker ticker, Options opts, SnapshotFetch fetch)
    : exchange_(exchange)
    , ticker_(std::move(ticker))
    , opts_(std::move(opts))
    , fetch_(std::move(fetch))
    , parser_(ticker_) {}

    ~StreamFeed() override { close(); }

    void connect() override {
        close();
        failed_.store(false, std::memory_order_relaxed);
        overflow_.store(false, std::memory_order_relaxed);
        opened_.store(false, std::memory_order_relaxed);
        queue_.drain();

        // The WS callback only enqueues; parsing happens on the consumer side.
        ws_ = std::make_unique<WsT>(opts_.stream,
            [this](const std::string& raw) {
                std::string msg(raw);
                if (!queue_.try_push(std::move(msg))) {
                    // Frames were lost; the book can only be rebuilt from a snapshot.
                    overflow_.store(true, std::memory_order_relaxed);
                }
            },
            [this](const std::string& what) {
                std::lock_guard<std::mutex> lk(err_m_);
                error_ = what;
                failed_.store(true, std::memory_order_release);
            },
            [this] { opened_.store(true, std::memory_order_release); });

        ws_thread_ = std::thread([this] { ws_->start(opts_.port); });

        try {
            // Snapshot only once the stream is buffering, so that the first
            // buffered diff can be bridged by sequence number.
            await_stream();
            pending_ = parser_.parse_snapshot(fetch_());
        } catch (const std::exception&) {
            close();
            throw;
        }
        last_frame_ = std::chrono::steady_clock::now();
    }

    bool next(std::vector<BookEvent>& out, std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string raw;

        for (;;) {
            throw_if_failed();

            if (overflow_.exchange(false, std::memory_order_relaxed)) {
                std::cerr << "[stream-feed] " << ticker_.str()
                          << " frame queue overflow; resyncing" << std::endl;
                resync();
            }

            if (pending_) {
                out.emplace_back(std::move(*pending_));
                pending_.reset();
                return true;
            }

            if (queue_.try_pop(raw)) {
                last_frame_ = std::chrono::steady_clock::now();
                if (parser_.parse(raw, out)) return true;
                continue;
            }

            const auto now = std::chrono::steady_clock::now();
            if (now - last_frame_ > opts_.stale_after) {
                throw FeedError("no frames for " + std::to_string(opts_.stale_after.count()) + "s");
            }
            if (now >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
    }

    // Frames queued before the new snapshot are kept: the book drops the
    // stale ones by sequence number.
    void resync() override {
        pending_ = parser_.parse_snapshot(fetch_());
    }

    void close() noexcept override {
        if (ws_) ws_->stop();
        if (ws_thread_.joinable()) ws_thread_.join();
        ws_.reset();
        pending_.reset();
    }

    Exchange exchange() const override { return exchange_; }
    const Ticker& ticker() const override { return ticker_; }

private:
    void await_stream() {
        const auto open_deadline = std::chrono::steady_clock::now() + opts_.open_timeout;
        while (!opened_.load(std::memory_order_acquire)) {
            throw_if_failed();
            if (std::chrono::steady_clock::now() >= open_deadline) {
                throw FeedError("stream handshake timed out after " +
                                std::to_string(opts_.open_timeout.count()) + "ms");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        // Quiet symbols may not send a diff at all; go ahead after the wait.
        const auto frame_deadline = std::chrono::steady_clock::now() + opts_.first_frame_wait;
        while (queue_.empty() && std::chrono::steady_clock::now() < frame_deadline) {
            throw_if_failed();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw_if_failed();
    }

    void throw_if_failed() {
        if (!failed_.load(std::memory_order_acquire)) return;
        std::lock_guard<std::mutex> lk(err_m_);
        throw FeedError("stream closed: " + error_);
    }

    // Identity
    Exchange exchange_;
    Ticker ticker_;
    Options opts_;
    SnapshotFetch fetch_;
    ParserT parser_;

    // Per-connection components
    SpscRing<std::string, QueuePow2> queue_;
    std::unique_ptr<WsT> ws_;
    std::thread ws_thread_;
    std::atomic<bool> failed_{false};
    std::atomic<bool> overflow_{false};
    std::atomic<bool> opened_{false};
    std::mutex err_m_;
    std::string error_;

    std::optional<BookSnapshot> pending_;
    std::chrono::steady_clock::time_point last_frame_{};
};
