#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config.hpp"
#include "md/exchange.hpp"
#include "md/exchange_feed.hpp"
#include "pipeline/collector.hpp"
#include "pipeline/persister.hpp"
#include "util/cancel_token.hpp"

class ConfigWatcher;

// Keeps the pool of per-symbol Collectors equal to the latest Config.
// The handle map is owned by the thread that calls reconcile()/run();
// none of the methods below may be called from other threads.
class Orchestrator {
public:
    using FeedFactory = Collector::FeedFactory;
    using ErrorSink = std::function<void(const ConfigError&)>;

    struct Options {
        Collector::Options collector;
        bool restart_failed{true};
        std::chrono::milliseconds restart_delay{std::chrono::seconds(5)};
        std::chrono::milliseconds tick{std::chrono::milliseconds(100)};
        ErrorSink on_config_error; // optional; errors are always logged
    };

    Orchestrator(Exchange exchange,
                 FeedFactory make_feed,
                 std::shared_ptr<Persister> persister)
        : Orchestrator(exchange, std::move(make_feed), std::move(persister), Options{}) {}

    Orchestrator(Exchange exchange,
                 FeedFactory make_feed,
                 std::shared_ptr<Persister> persister,
                 Options opts);

    ~Orchestrator() { shutdown(); }

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Applies one Config: stops removed symbols (all signalled first, then
    // awaited), starts added ones, leaves unchanged ones alone. Returns
    // false and changes nothing if the Config names another exchange.
    bool reconcile(const Config& cfg);

    // Reaps Failed collectors and restarts them if still wanted.
    void supervise();

    // Drains `watcher` events until `cancel` fires, then shuts down.
    void run(ConfigWatcher& watcher, const CancelToken& cancel);

    // Cancels every collector and waits for all of them to acknowledge.
    void shutdown();

    std::set<std::string> active_symbols() const;
    std::optional<std::uint64_t> instance_id(const std::string& symbol) const;
    std::shared_ptr<const CollectorStatus> status(const std::string& symbol) const;

private:
    struct Handle {
        std::string symbol;
        std::uint64_t instance_id{0};
        CancelToken cancel;
        std::shared_ptr<CollectorStatus> status;
        std::unique_ptr<Collector> collector;
        std::thread worker;
    };

    void spawn(const std::string& symbol);
    void stop_all(std::vector<Handle>& handles);
    void report(const ConfigError& e);

    Exchange exchange_;
    FeedFactory make_feed_;
    std::shared_ptr<Persister> persister_;
    Options opts_;

    std::unordered_map<std::string, Handle> handles_;
    std::set<std::string> target_;
    // Failed symbols waiting for restart_delay before being respawned.
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> restart_at_;
    std::uint64_t next_instance_{1};
};
