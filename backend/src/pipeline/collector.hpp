#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "md/book.hpp"
#include "md/exchange.hpp"
#include "md/exchange_feed.hpp"
#include "md/symbol_codec.hpp"
#include "pipeline/persister.hpp"
#include "util/cancel_token.hpp"

enum class CollectorHealth : uint8_t {
    Starting,
    Running,
    Resyncing,
    Backoff,
    Failed,  // retry budget exhausted; the collector has exited
    Stopped  // cancelled and acknowledged
};

const char* to_string(CollectorHealth h) noexcept;

// Health and counters of one collector. Written by the collector thread,
// read by the orchestrator and observers.
class CollectorStatus {
public:
    CollectorHealth health() const noexcept { return health_.load(std::memory_order_acquire); }
    void set_health(CollectorHealth h) noexcept { health_.store(h, std::memory_order_release); }

    std::string last_error() const {
        std::lock_guard<std::mutex> lk(m_);
        return last_error_;
    }
    void set_error(std::string what) {
        std::lock_guard<std::mutex> lk(m_);
        last_error_ = std::move(what);
    }

    std::atomic<std::uint64_t> events_applied{0};
    std::atomic<std::uint64_t> snapshots_written{0};
    std::atomic<std::uint64_t> persist_failures{0};
    std::atomic<std::uint64_t> resyncs{0};
    std::atomic<std::uint64_t> reconnects{0};

private:
    std::atomic<CollectorHealth> health_{CollectorHealth::Starting};
    mutable std::mutex m_;
    std::string last_error_;
};

// Collects one symbol: pulls events from its feed, applies them to its Book
// in arrival order and hands periodic snapshots to the Persister.
// It only observes its cancellation token and writes its own status; it
// holds no reference to whoever started it.
class Collector {
public:
    using FeedFactory = std::function<std::unique_ptr<IExchangeFeed>(const Ticker&)>;

    struct Options {
        std::chrono::milliseconds snapshot_interval{std::chrono::seconds(1)};
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(200)};
        std::size_t depth{20};
        std::chrono::milliseconds backoff_initial{std::chrono::milliseconds(500)};
        std::chrono::milliseconds backoff_max{std::chrono::seconds(30)};
        std::size_t max_retries{5};
        std::chrono::milliseconds retry_window{std::chrono::seconds(60)};
        bool flush_on_stop{true};
    };

    Collector(Ticker ticker,
              Exchange exchange,
              FeedFactory make_feed,
              std::shared_ptr<Persister> persister,
              Options opts,
              std::shared_ptr<CollectorStatus> status);

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    // Blocks until `cancel` fires (status Stopped) or the retry budget is
    // exhausted (status Failed). Never throws.
    void run(const CancelToken& cancel);

    const Book& book() const noexcept { return book_; }

private:
    void pump(const CancelToken& cancel, IExchangeFeed& feed);
    void apply(const std::vector<BookEvent>& evs);
    void resync(IExchangeFeed& feed, const std::string& why);
    void maybe_snapshot();
    void persist_snapshot();
    bool retry_budget_exhausted();

    Ticker ticker_;
    std::string symbol_;
    Exchange exchange_;
    FeedFactory make_feed_;
    std::shared_ptr<Persister> persister_;
    Options opts_;
    std::shared_ptr<CollectorStatus> status_;

    Book book_;
    std::int64_t next_snapshot_ms_{0};
    std::uint64_t session_events_{0};
    std::deque<std::chrono::steady_clock::time_point> failures_;
};
