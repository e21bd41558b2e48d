#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "config/config.hpp"
#include "util/cancel_token.hpp"
#include "util/spsc_ring.hpp"

// Watches the config file and turns edits into a sequence of distinct,
// valid Configs, starting with the initial load.
//  - Identical file content is never re-parsed.
//  - Malformed content, a missing file or a change of exchange is reported
//    as a ConfigError and the last good Config stays in effect.
//  - Only the latest edit matters; transient intermediate edits may be missed.
// A single background thread polls; a single consumer drains try_next().
class ConfigWatcher {
public:
    using ErrorSink = std::function<void(const ConfigError&)>;

    struct Options {
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(500)};
        ErrorSink on_error; // optional; errors are always logged
    };

    explicit ConfigWatcher(std::filesystem::path path)
        : ConfigWatcher(std::move(path), Options{}) {}
    ConfigWatcher(std::filesystem::path path, Options opts);
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    // Reads the file once and pins its exchange for the process lifetime.
    // The result is also queued as the first event. Throws FatalStartupError.
    Config load_initial();

    // One polling step; returns a Config only when a new one takes effect.
    // Called by the watcher thread once start()ed.
    std::optional<Config> poll();

    void start();
    void stop();

    // Consumer side: next queued Config, if any.
    bool try_next(Config& out) { return events_.try_pop(out); }

    std::uint64_t error_count() const noexcept { return errors_.load(std::memory_order_relaxed); }

private:
    void report(const ConfigError& e);
    void watch_loop();

    std::filesystem::path path_;
    Options opts_;

    std::optional<Exchange> pinned_;
    Config current_;
    std::string last_text_;
    bool read_failed_{false};
    std::optional<Config> unsent_;

    SpscRing<Config, 64> events_;
    std::atomic<std::uint64_t> errors_{0};
    CancelToken stop_;
    std::thread thread_;
};
