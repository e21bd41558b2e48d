#include "config/config_watcher.hpp"

#include <iostream>
#include <utility>

ConfigWatcher::ConfigWatcher(std::filesystem::path path, Options opts)
    : path_(std::move(path)), opts_(std::move(opts)) {}

ConfigWatcher::~ConfigWatcher() { stop(); }

Config ConfigWatcher::load_initial() {
    std::string text;
    Config cfg;
    try {
        text = read_config_text(path_);
        cfg = parse_config(text);
    } catch (const ConfigError& e) {
        throw FatalStartupError(std::string("invalid initial config: ") + e.what());
    }

    pinned_ = cfg.exchange;
    current_ = cfg;
    last_text_ = std::move(text);
    std::cout << "[config] Loaded " << path_.string() << ": CEX "
              << to_string(cfg.exchange) << ", " << cfg.tickers.size() << " tickers" << std::endl;

    Config queued = cfg;
    if (!events_.try_push(std::move(queued))) {
        unsent_ = cfg;
    }
    return cfg;
}

std::optional<Config> ConfigWatcher::poll() {
    std::string text;
    try {
        text = read_config_text(path_);
    } catch (const ConfigError& e) {
        // report once per outage, keep polling
        if (!read_failed_) report(e);
        read_failed_ = true;
        return std::nullopt;
    }
    read_failed_ = false;

    if (text == last_text_) return std::nullopt;
    last_text_ = text;

    Config cfg;
    try {
        cfg = parse_config(text);
    } catch (const ConfigError& e) {
        report(e);
        return std::nullopt;
    }

    if (pinned_ && cfg.exchange != *pinned_) {
        report(ConfigError(std::string("changing cex from ") + to_string(*pinned_) + " to " +
                           to_string(cfg.exchange) + " is not supported; edit ignored until reverted"));
        return std::nullopt;
    }
    if (!pinned_) pinned_ = cfg.exchange;

    if (cfg == current_) return std::nullopt;
    current_ = cfg;
    std::cout << "[config] Change detected: " << cfg.tickers.size() << " tickers" << std::endl;
    return cfg;
}

void ConfigWatcher::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread([this] { watch_loop(); });
}

void ConfigWatcher::stop() {
    stop_.cancel();
    if (thread_.joinable()) thread_.join();
}

void ConfigWatcher::watch_loop() {
    while (!stop_.wait_for(opts_.poll_interval)) {
        if (auto cfg = poll()) {
            unsent_ = std::move(cfg);
        }
        // Consumer lagging: keep only the latest and retry next tick.
        if (unsent_) {
            Config out = *unsent_;
            if (events_.try_push(std::move(out))) unsent_.reset();
        }
    }
}

void ConfigWatcher::report(const ConfigError& e) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[config] " << e.what() << std::endl;
    if (opts_.on_error) opts_.on_error(e);
}
