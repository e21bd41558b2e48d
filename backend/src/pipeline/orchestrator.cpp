#include "pipeline/orchestrator.hpp"
#include "config/config_watcher.hpp"

#include <iostream>
#include <utility>

Orchestrator::Orchestrator(Exchange exchange,
                           FeedFactory make_feed,
                           std::shared_ptr<Persister> persister,
                           Options opts)
    : exchange_(exchange),
      make_feed_(std::move(make_feed)),
      persister_(std::move(persister)),
      opts_(std::move(opts)) {}

bool Orchestrator::reconcile(const Config& cfg) {
    if (cfg.exchange != exchange_) {
        report(ConfigError(std::string("config names cex ") + to_string(cfg.exchange) +
                           " but collectors run on " + to_string(exchange_) + "; ignored"));
        return false;
    }

    target_ = cfg.tickers;

    std::vector<Handle> to_stop;
    for (auto it = handles_.begin(); it != handles_.end();) {
        if (target_.count(it->first)) {
            ++it;
            continue;
        }
        std::cout << "[orchestrator] Stop " << it->first << std::endl;
        it->second.cancel.cancel();
        to_stop.push_back(std::move(it->second));
        it = handles_.erase(it);
    }
    for (auto it = restart_at_.begin(); it != restart_at_.end();) {
        if (target_.count(it->first)) ++it;
        else it = restart_at_.erase(it);
    }

    for (const auto& symbol : target_) {
        if (handles_.count(symbol) || restart_at_.count(symbol)) continue;
        spawn(symbol);
    }

    stop_all(to_stop);
    return true;
}

void Orchestrator::supervise() {
    const auto now = std::chrono::steady_clock::now();

    std::vector<Handle> failed;
    for (auto it = handles_.begin(); it != handles_.end();) {
        if (it->second.status->health() != CollectorHealth::Failed) {
            ++it;
            continue;
        }
        std::cerr << "[orchestrator] Collector for " << it->first << " failed: "
                  << it->second.status->last_error() << std::endl;
        if (opts_.restart_failed) {
            restart_at_[it->first] = now + opts_.restart_delay;
        } else {
            std::cerr << "[orchestrator] " << it->first
                      << " left unmanaged until it is re-added to the config" << std::endl;
        }
        failed.push_back(std::move(it->second));
        it = handles_.erase(it);
    }
    stop_all(failed);

    for (auto it = restart_at_.begin(); it != restart_at_.end();) {
        if (now < it->second) {
            ++it;
            continue;
        }
        const std::string symbol = it->first;
        it = restart_at_.erase(it);
        if (target_.count(symbol) && !handles_.count(symbol)) {
            std::cout << "[orchestrator] Restarting " << symbol << std::endl;
            spawn(symbol);
        }
    }
}

void Orchestrator::run(ConfigWatcher& watcher, const CancelToken& cancel) {
    watcher.start();
    std::cout << "[orchestrator] Running on " << to_string(exchange_) << std::endl;

    Config cfg;
    while (!cancel.cancelled()) {
        // Config events are applied one at a time, in order.
        while (!cancel.cancelled() && watcher.try_next(cfg)) {
            reconcile(cfg);
        }
        supervise();
        if (cancel.wait_for(opts_.tick)) break;
    }

    watcher.stop();
    shutdown();
}

void Orchestrator::shutdown() {
    if (handles_.empty()) return;
    std::cout << "[orchestrator] Shutting down " << handles_.size() << " collectors" << std::endl;

    std::vector<Handle> to_stop;
    to_stop.reserve(handles_.size());
    for (auto& kv : handles_) {
        kv.second.cancel.cancel();
        to_stop.push_back(std::move(kv.second));
    }
    handles_.clear();
    restart_at_.clear();
    stop_all(to_stop);
}

std::set<std::string> Orchestrator::active_symbols() const {
    std::set<std::string> out;
    for (const auto& kv : handles_) out.insert(kv.first);
    return out;
}

std::optional<std::uint64_t> Orchestrator::instance_id(const std::string& symbol) const {
    auto it = handles_.find(symbol);
    if (it == handles_.end()) return std::nullopt;
    return it->second.instance_id;
}

std::shared_ptr<const CollectorStatus> Orchestrator::status(const std::string& symbol) const {
    auto it = handles_.find(symbol);
    if (it == handles_.end()) return nullptr;
    return it->second.status;
}

void Orchestrator::spawn(const std::string& symbol) {
    auto ticker = Ticker::parse(symbol);
    if (!ticker) {
        // parse_config already filters these; keep the invariant local anyway
        std::cerr << "[orchestrator] Invalid symbol format: " << symbol << std::endl;
        return;
    }

    Handle h;
    h.symbol = symbol;
    h.instance_id = next_instance_++;
    h.status = std::make_shared<CollectorStatus>();
    h.collector = std::make_unique<Collector>(*ticker, exchange_, make_feed_, persister_,
                                              opts_.collector, h.status);
    h.worker = std::thread([c = h.collector.get(), token = h.cancel] { c->run(token); });

    std::cout << "[orchestrator] Start " << symbol << " (instance " << h.instance_id << ")" << std::endl;
    handles_.emplace(symbol, std::move(h));
}

// Every handle passed in has already been signalled; joining them in turn
// waits for the slowest while the others wind down in parallel.
void Orchestrator::stop_all(std::vector<Handle>& handles) {
    for (auto& h : handles) {
        h.cancel.cancel();
    }
    for (auto& h : handles) {
        if (h.worker.joinable()) h.worker.join();
        std::cout << "[orchestrator] " << h.symbol << " acknowledged stop ("
                  << to_string(h.status->health()) << ")" << std::endl;
    }
    handles.clear();
}

void Orchestrator::report(const ConfigError& e) {
    std::cerr << "[orchestrator] " << e.what() << std::endl;
    if (opts_.on_config_error) opts_.on_config_error(e);
}
