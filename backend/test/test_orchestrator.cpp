#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "config/config_watcher.hpp"
#include "pipeline/orchestrator.hpp"
#include "fake_feed.hpp"
#include "temp_dir.hpp"

using namespace std::chrono_literals;

namespace {

// One script per symbol, created on first use.
struct ScriptBook {
    std::mutex m;
    std::map<std::string, std::shared_ptr<FeedScript>> scripts;
    std::chrono::milliseconds close_delay{0};
    std::map<std::string, std::chrono::milliseconds> close_delay_for;
    int fail_connects{0};

    std::shared_ptr<FeedScript> get(const std::string& symbol) {
        std::lock_guard<std::mutex> lk(m);
        auto& s = scripts[symbol];
        if (!s) {
            s = std::make_shared<FeedScript>();
            s->initial = make_snapshot(symbol, 1, {{100.0, 1.0}}, {{101.0, 1.0}});
            auto d = close_delay_for.find(symbol);
            s->close_delay = d != close_delay_for.end() ? d->second : close_delay;
            s->fail_connects = fail_connects;
        }
        return s;
    }

    Orchestrator::FeedFactory factory(Exchange ex) {
        return [this, ex](const Ticker& t) -> std::unique_ptr<IExchangeFeed> {
            return std::make_unique<FakeFeed>(ex, t, get(t.str()));
        };
    }
};

Orchestrator::Options fast_options() {
    Orchestrator::Options o;
    o.collector.snapshot_interval = 20ms;
    o.collector.poll_interval = 5ms;
    o.collector.backoff_initial = 1ms;
    o.collector.backoff_max = 2ms;
    o.collector.max_retries = 2;
    o.restart_delay = 20ms;
    o.tick = 5ms;
    return o;
}

Config binance(std::set<std::string> tickers) {
    Config c;
    c.exchange = Exchange::Binance;
    c.tickers = std::move(tickers);
    return c;
}

} // namespace

TEST(OrchestratorTest, ReconcileStartsAndStopsOnlyTheDifference) {
    TempDir dir;
    ScriptBook scripts;
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), fast_options());

    ASSERT_TRUE(orch.reconcile(binance({"BTC_USDT", "ETH_USDT"})));
    EXPECT_EQ(orch.active_symbols(), (std::set<std::string>{"BTC_USDT", "ETH_USDT"}));
    const auto btc_id = orch.instance_id("BTC_USDT");
    const auto eth_status = orch.status("ETH_USDT");
    ASSERT_TRUE(btc_id.has_value());
    ASSERT_TRUE(eth_status);

    ASSERT_TRUE(orch.reconcile(binance({"BTC_USDT", "SOL_USDT"})));
    EXPECT_EQ(orch.active_symbols(), (std::set<std::string>{"BTC_USDT", "SOL_USDT"}));
    EXPECT_EQ(orch.instance_id("BTC_USDT"), btc_id); // untouched
    EXPECT_FALSE(orch.instance_id("ETH_USDT").has_value());
    EXPECT_GT(*orch.instance_id("SOL_USDT"), *btc_id);
    EXPECT_EQ(eth_status->health(), CollectorHealth::Stopped); // acknowledged before return

    // Re-applying the same config is a no-op
    ASSERT_TRUE(orch.reconcile(binance({"BTC_USDT", "SOL_USDT"})));
    EXPECT_EQ(orch.instance_id("BTC_USDT"), btc_id);
}

TEST(OrchestratorTest, ReAddedSymbolGetsFreshInstance) {
    TempDir dir;
    ScriptBook scripts;
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), fast_options());

    orch.reconcile(binance({"BTC_USDT"}));
    const auto first = *orch.instance_id("BTC_USDT");
    orch.reconcile(binance({}));
    EXPECT_TRUE(orch.active_symbols().empty());
    orch.reconcile(binance({"BTC_USDT"}));
    EXPECT_NE(*orch.instance_id("BTC_USDT"), first);
}

TEST(OrchestratorTest, ConfigForOtherExchangeIsRejected) {
    TempDir dir;
    ScriptBook scripts;
    auto opts = fast_options();
    int errors = 0;
    opts.on_config_error = [&](const ConfigError&) { ++errors; };
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), opts);

    orch.reconcile(binance({"BTC_USDT"}));
    Config other;
    other.exchange = Exchange::Bitkub;
    other.tickers = {"BTC_THB"};

    EXPECT_FALSE(orch.reconcile(other));
    EXPECT_EQ(errors, 1);
    EXPECT_EQ(orch.active_symbols(), (std::set<std::string>{"BTC_USDT"}));
}

TEST(OrchestratorTest, RemovedCollectorsStopConcurrently) {
    TempDir dir;
    ScriptBook scripts;
    scripts.close_delay = 400ms;
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), fast_options());

    orch.reconcile(binance({"BTC_USDT", "ETH_USDT", "SOL_USDT"}));
    ASSERT_TRUE(eventually([&] {
        for (const auto& s : orch.active_symbols()) {
            if (orch.status(s)->health() != CollectorHealth::Running) return false;
        }
        return true;
    }));

    const auto t0 = std::chrono::steady_clock::now();
    orch.reconcile(binance({}));
    const auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_TRUE(orch.active_symbols().empty());
    EXPECT_LT(took, 1000ms); // three 400ms closes run side by side
}

TEST(OrchestratorTest, SlowShutdownDoesNotDelayOthers) {
    TempDir dir;
    ScriptBook scripts;
    scripts.close_delay_for["BTC_USDT"] = 1000ms;
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), fast_options());

    orch.reconcile(binance({"BTC_USDT", "ETH_USDT"}));
    auto btc = orch.status("BTC_USDT");
    auto eth = orch.status("ETH_USDT");
    ASSERT_TRUE(eventually([&] {
        return btc->health() == CollectorHealth::Running && eth->health() == CollectorHealth::Running;
    }));

    const auto t0 = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration eth_stopped_after{};
    std::thread observer([&] {
        eventually([&] { return eth->health() == CollectorHealth::Stopped; });
        eth_stopped_after = std::chrono::steady_clock::now() - t0;
    });

    orch.reconcile(binance({}));
    const auto took = std::chrono::steady_clock::now() - t0;
    observer.join();

    EXPECT_EQ(btc->health(), CollectorHealth::Stopped);
    EXPECT_GE(took, 1000ms);
    EXPECT_LT(eth_stopped_after, 500ms);
}

TEST(OrchestratorTest, FailedCollectorIsRestarted) {
    TempDir dir;
    ScriptBook scripts;
    scripts.fail_connects = 3; // first instance exhausts max_retries=2
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), fast_options());

    orch.reconcile(binance({"BTC_USDT"}));
    const auto first = *orch.instance_id("BTC_USDT");

    ASSERT_TRUE(eventually([&] {
        orch.supervise();
        auto id = orch.instance_id("BTC_USDT");
        return id && *id != first && orch.status("BTC_USDT")->health() == CollectorHealth::Running;
    }));
}

TEST(OrchestratorTest, FailedCollectorStaysDownWithoutRestart) {
    TempDir dir;
    ScriptBook scripts;
    scripts.fail_connects = 1000;
    auto opts = fast_options();
    opts.restart_failed = false;
    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance),
                      std::make_shared<Persister>(dir.path()), opts);

    orch.reconcile(binance({"BTC_USDT", "ETH_USDT"}));
    ASSERT_TRUE(eventually([&] {
        orch.supervise();
        return orch.active_symbols().empty();
    }));

    std::this_thread::sleep_for(50ms);
    orch.supervise();
    EXPECT_TRUE(orch.active_symbols().empty());
}

TEST(OrchestratorTest, ShutdownStopsEveryCollector) {
    TempDir dir;
    ScriptBook scripts;
    auto orch = std::make_unique<Orchestrator>(Exchange::Binance, scripts.factory(Exchange::Binance),
                                               std::make_shared<Persister>(dir.path()), fast_options());
    orch->reconcile(binance({"BTC_USDT", "ETH_USDT"}));
    auto btc = orch->status("BTC_USDT");
    auto eth = orch->status("ETH_USDT");

    orch->shutdown();
    EXPECT_TRUE(orch->active_symbols().empty());
    EXPECT_EQ(btc->health(), CollectorHealth::Stopped);
    EXPECT_EQ(eth->health(), CollectorHealth::Stopped);
    orch.reset(); // second shutdown via destructor is harmless
}

TEST(OrchestratorTest, RunFollowsConfigFileEdits) {
    TempDir dir;
    ScriptBook scripts;
    const auto cfg_path = dir.write("config.json", R"({"cex":"BINANCE","tickers":["BTC_USDT"]})");
    auto persister = std::make_shared<Persister>(dir.path() / "data");

    ConfigWatcher::Options wopts;
    wopts.poll_interval = 10ms;
    ConfigWatcher watcher(cfg_path, wopts);
    watcher.load_initial();

    Orchestrator orch(Exchange::Binance, scripts.factory(Exchange::Binance), persister, fast_options());
    CancelToken cancel;
    std::thread runner([&] { orch.run(watcher, cancel); });

    EXPECT_TRUE(eventually([&] { return persister->read("BINANCE", "BTC_USDT").has_value(); }));

    dir.write("config.json", R"({"cex":"BINANCE","tickers":["BTC_USDT","ETH_USDT"]})");
    EXPECT_TRUE(eventually([&] { return persister->read("BINANCE", "ETH_USDT").has_value(); }));

    cancel.cancel();
    runner.join();
    EXPECT_TRUE(orch.active_symbols().empty());
}
