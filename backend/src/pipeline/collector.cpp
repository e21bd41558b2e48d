#include "pipeline/collector.hpp"
#include "util/clock.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

const char* to_string(CollectorHealth h) noexcept {
    switch (h) {
        case CollectorHealth::Starting:  return "starting";
        case CollectorHealth::Running:   return "running";
        case CollectorHealth::Resyncing: return "resyncing";
        case CollectorHealth::Backoff:   return "backoff";
        case CollectorHealth::Failed:    return "failed";
        case CollectorHealth::Stopped:   return "stopped";
    }
    return "unknown";
}

Collector::Collector(Ticker ticker,
                     Exchange exchange,
                     FeedFactory make_feed,
                     std::shared_ptr<Persister> persister,
                     Options opts,
                     std::shared_ptr<CollectorStatus> status)
    : ticker_(std::move(ticker)),
      symbol_(ticker_.str()),
      exchange_(exchange),
      make_feed_(std::move(make_feed)),
      persister_(std::move(persister)),
      opts_(opts),
      status_(status ? std::move(status) : std::make_shared<CollectorStatus>()),
      book_(symbol_) {}

void Collector::run(const CancelToken& cancel) {
    status_->set_health(CollectorHealth::Starting);
    std::cout << "[collector] Start " << symbol_ << " on " << to_string(exchange_) << std::endl;

    const auto now = wall_ms();
    next_snapshot_ms_ = now + ms_to_next_boundary(now, opts_.snapshot_interval.count());

    auto backoff = opts_.backoff_initial;
    std::unique_ptr<IExchangeFeed> feed;

    while (!cancel.cancelled()) {
        session_events_ = 0;
        try {
            feed = make_feed_ ? make_feed_(ticker_) : nullptr;
            if (!feed) {
                throw FeedError("no feed available for " + symbol_);
            }
            feed->connect();
            book_.reset();
            status_->set_health(CollectorHealth::Running);
            std::cout << "[collector] Connected " << feed->ticker().str() << " on "
                      << to_string(feed->exchange()) << std::endl;
            pump(cancel, *feed);
        } catch (const FeedError& e) {
            if (feed) feed->close();
            feed.reset();
            // The book belongs to the dead session; nothing of it is flushed.
            book_.reset();
            status_->set_error(e.what());
            status_->reconnects.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[collector] " << symbol_ << " feed error: " << e.what() << std::endl;

            if (session_events_ > 0) backoff = opts_.backoff_initial;
            if (retry_budget_exhausted()) {
                status_->set_error(std::string("retry budget exhausted: ") + e.what());
                status_->set_health(CollectorHealth::Failed);
                std::cerr << "[collector] " << symbol_ << " giving up after "
                          << failures_.size() << " failures within "
                          << opts_.retry_window.count() << "ms" << std::endl;
                return;
            }

            status_->set_health(CollectorHealth::Backoff);
            std::cout << "[collector] " << symbol_ << " reconnecting in "
                      << backoff.count() << "ms" << std::endl;
            if (cancel.wait_for(backoff)) break;
            backoff = std::min(backoff * 2, opts_.backoff_max);
        } catch (const std::exception& e) {
            // Anything else is a bug in a collaborator; surface it instead of looping.
            if (feed) feed->close();
            feed.reset();
            status_->set_error(e.what());
            status_->set_health(CollectorHealth::Failed);
            std::cerr << "[collector] " << symbol_ << " unexpected error: " << e.what() << std::endl;
            return;
        }
    }

    if (opts_.flush_on_stop) {
        const auto state = book_.state();
        if (state != BookState::Empty && state != BookState::Anomalous) {
            persist_snapshot();
        }
    }
    if (feed) feed->close();
    status_->set_health(CollectorHealth::Stopped);
    std::cout << "[collector] Worker for " << symbol_ << " is stopped" << std::endl;
}

void Collector::pump(const CancelToken& cancel, IExchangeFeed& feed) {
    std::vector<BookEvent> evs;
    while (!cancel.cancelled()) {
        evs.clear();
        if (feed.next(evs, opts_.poll_interval)) {
            try {
                apply(evs);
            } catch (const BookConsistencyError& e) {
                // The rest of this batch belongs to the broken session.
                resync(feed, e.what());
            }
        }
        maybe_snapshot();
    }
}

void Collector::apply(const std::vector<BookEvent>& evs) {
    const auto res = book_.apply_many(evs);
    session_events_ += res.applied;
    status_->events_applied.fetch_add(res.applied, std::memory_order_relaxed);
    if (res.result == ApplyResult::Anomaly || res.result == ApplyResult::Rejected) {
        throw BookConsistencyError(book_.anomaly_reason());
    }
}

void Collector::resync(IExchangeFeed& feed, const std::string& why) {
    std::cerr << "[collector] " << symbol_ << " book anomaly: " << why << "; resyncing" << std::endl;
    status_->set_error("book anomaly: " + why);
    status_->set_health(CollectorHealth::Resyncing);
    status_->resyncs.fetch_add(1, std::memory_order_relaxed);
    feed.resync();
    book_.reset();
    status_->set_health(CollectorHealth::Running);
}

void Collector::maybe_snapshot() {
    const auto now = wall_ms();
    if (now < next_snapshot_ms_) return;
    next_snapshot_ms_ = now + ms_to_next_boundary(now, opts_.snapshot_interval.count());

    const auto state = book_.state();
    if (state == BookState::Empty || state == BookState::Anomalous) return;
    persist_snapshot();
}

void Collector::persist_snapshot() {
    if (!persister_) return;
    DepthSnapshot snap = book_.snapshot(opts_.depth, wall_ms());
    snap.exchange = to_string(exchange_);
    try {
        persister_->write(snap);
        status_->snapshots_written.fetch_add(1, std::memory_order_relaxed);
    } catch (const PersistenceError& e) {
        status_->persist_failures.fetch_add(1, std::memory_order_relaxed);
        status_->set_error(e.what());
        std::cerr << "[collector] " << symbol_ << " snapshot skipped: " << e.what() << std::endl;
    }
}

bool Collector::retry_budget_exhausted() {
    const auto now = std::chrono::steady_clock::now();
    failures_.push_back(now);
    while (!failures_.empty() && now - failures_.front() > opts_.retry_window) {
        failures_.pop_front();
    }
    return failures_.size() > opts_.max_retries;
}
