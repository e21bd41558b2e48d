#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include "md/book.hpp"
#include "pipeline/stream_feed.hpp"
#include "venues/binance/parser.hpp"
#include "venues/market_ws.hpp"

using namespace std::chrono_literals;

namespace {

// Behaviour of the next ScriptedWs; one per test.
struct WsScript {
    std::chrono::milliseconds handshake{0};
    bool refuse{false};
    std::vector<std::string> frames; // sent right after the handshake
    std::atomic<bool> opened{false};
};

WsScript* g_ws = nullptr;

// Stands in for BinanceWs: same constructor and start/stop contract.
class ScriptedWs : public IMarketWs {
public:
    ScriptedWs(std::string, OnMsg on_msg, OnError on_error, OnOpen on_open)
        : on_msg_(std::move(on_msg)), on_error_(std::move(on_error)), on_open_(std::move(on_open)) {}

    void start(unsigned short) override {
        std::unique_lock<std::mutex> lk(m_);
        if (cv_.wait_for(lk, g_ws->handshake, [this] { return stop_; })) return;
        if (g_ws->refuse) {
            lk.unlock();
            on_error_("connection refused");
            return;
        }
        g_ws->opened = true;
        lk.unlock();
        on_open_();
        for (const auto& f : g_ws->frames) on_msg_(f);
        lk.lock();
        cv_.wait(lk, [this] { return stop_; });
    }

    void stop() noexcept override {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
    }

private:
    OnMsg on_msg_;
    OnError on_error_;
    OnOpen on_open_;
    std::mutex m_;
    std::condition_variable cv_;
    bool stop_{false};
};

using Feed = StreamFeed<ScriptedWs, BinanceBookParser, 64>;

Feed::Options feed_options() {
    Feed::Options o;
    o.stream = "btcusdt";
    o.open_timeout = 2000ms;
    o.first_frame_wait = 500ms;
    return o;
}

const char* kSnapshot =
    R"({"lastUpdateId":100,"bids":[["100","1"]],"asks":[["100.5","1"],["101","1"]]})";

} // namespace

TEST(StreamFeedTest, SnapshotIsFetchedAfterHandshake) {
    WsScript script;
    script.handshake = 150ms;
    // Buyer lifts the 100.5 ask: bid level first, then the ask removal.
    script.frames = {
        R"({"e":"depthUpdate","E":1,"s":"BTCUSDT","U":101,"u":101,"b":[["100.5","2"]],"a":[["100.5","0"]]})"};
    g_ws = &script;

    int fetches = 0;
    bool opened_at_fetch = false;
    Feed feed(Exchange::Binance, Ticker{"BTC", "USDT"}, feed_options(), [&] {
        ++fetches;
        opened_at_fetch = script.opened.load();
        return std::string(kSnapshot);
    });

    feed.connect();
    EXPECT_EQ(fetches, 1);
    EXPECT_TRUE(opened_at_fetch);

    Book book("BTC_USDT");
    std::vector<BookEvent> evs;
    for (int i = 0; i < 2; ++i) {
        evs.clear();
        ASSERT_TRUE(feed.next(evs, 1000ms));
        EXPECT_EQ(book.apply_many(evs).result, ApplyResult::Applied);
    }
    feed.close();

    EXPECT_EQ(book.state(), BookState::Consistent);
    EXPECT_EQ(book.last_seq(), 101u);
    EXPECT_EQ(book.best_bid()->first, 100.5);
    EXPECT_EQ(book.best_ask()->first, 101.0);
    EXPECT_EQ(fetches, 1); // no resync was needed
}

TEST(StreamFeedTest, RefusedConnectionFailsWithoutSnapshot) {
    WsScript script;
    script.refuse = true;
    g_ws = &script;

    int fetches = 0;
    Feed feed(Exchange::Binance, Ticker{"BTC", "USDT"}, feed_options(), [&] {
        ++fetches;
        return std::string(kSnapshot);
    });

    EXPECT_THROW(feed.connect(), FeedError);
    EXPECT_EQ(fetches, 0);
}

TEST(StreamFeedTest, HandshakeTimeoutIsFeedError) {
    WsScript script;
    script.handshake = 10s;
    g_ws = &script;

    auto opts = feed_options();
    opts.open_timeout = 50ms;
    Feed feed(Exchange::Binance, Ticker{"BTC", "USDT"}, opts, [] { return std::string(kSnapshot); });

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(feed.connect(), FeedError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
}
