#pragma once
#include <map>
#include <vector>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <cstddef>
#include <variant>
#include <algorithm>
#include <functional>
#include <utility>
#include <cstdint>

#include "book_events.hpp"
#include "depth_snapshot.hpp"

enum class ApplyResult : uint8_t {
    Applied,  // state updated (removing an absent level also counts)
    Stale,    // sequenced delta older than the watermark; dropped
    Rejected, // book is ANOMALOUS; nothing is applied until reset()
    Anomaly   // this event moved the book into ANOMALOUS
};

// Full-depth limit order book for one symbol with an explicit state machine.
// - BookSnapshot replaces both sides with absolute sizes.
// - BookDelta is absolute size at price (0 or Delete => erase).
// - Sequenced deltas must continue the watermark without gaps; a gap, a
//   foreign symbol or a crossed book moves the state to ANOMALOUS, which is
//   sticky until reset().
// - apply(BookDelta) checks for a crossed book after that single level;
//   apply_many() checks after each whole exchange event.
// - Mutated by a single writer (the owning Collector); readers take a shared
//   lock and get copies.
class Book {
public:
    explicit Book(std::string symbol)
        : symbol_(std::move(symbol)) {}

    ApplyResult apply(const BookSnapshot& snap) {
        std::unique_lock lk(m_);
        return apply_unlocked(snap);
    }
    ApplyResult apply(const BookDelta& d) {
        std::unique_lock lk(m_);
        return apply_unlocked(d);
    }
    ApplyResult apply(const BookEvent& ev) {
        std::unique_lock lk(m_);
        return std::visit([this](auto&& e){ return apply_unlocked(e); }, ev);
    }

    struct BatchResult {
        ApplyResult result{ApplyResult::Stale}; // Applied if anything was applied
        std::size_t applied{0};                 // events applied before stopping
    };

    // Applies a batch in order under one lock. Consecutive deltas sharing a
    // non-zero (first_seq, seq) are one exchange event: the crossed-book check
    // runs once after its last level. Stops at the first Anomaly/Rejected.
    BatchResult apply_many(const std::vector<BookEvent>& evs) {
        std::unique_lock lk(m_);
        BatchResult out;
        for (std::size_t i = 0; i < evs.size(); ++i) {
            ApplyResult r;
            if (const auto* snap = std::get_if<BookSnapshot>(&evs[i])) {
                r = apply_unlocked(*snap);
            } else {
                const auto& d = std::get<BookDelta>(evs[i]);
                r = apply_level(d);
                const BookEvent* next = i + 1 < evs.size() ? &evs[i + 1] : nullptr;
                if (r == ApplyResult::Applied && !continues_event(d, next)) {
                    r = settle();
                }
            }
            if (r == ApplyResult::Anomaly || r == ApplyResult::Rejected) {
                out.result = r;
                return out;
            }
            if (r == ApplyResult::Applied) {
                out.result = ApplyResult::Applied;
                ++out.applied;
            }
        }
        return out;
    }

    // Back to EMPTY with no sequence watermark (used before a resync snapshot).
    void reset() {
        std::unique_lock lk(m_);
        bids_.clear(); asks_.clear();
        last_seq_ = 0;
        last_first_seq_ = 0;
        state_ = BookState::Empty;
        anomaly_.clear();
    }

    // Point-in-time copy of the top `depth` levels per side.
    DepthSnapshot snapshot(std::size_t depth, std::int64_t time_ms) const {
        std::shared_lock lk(m_);
        DepthSnapshot out;
        out.symbol = symbol_;
        out.time_ms = time_ms;
        out.last_update_id = last_seq_;
        out.state = state_;
        out.bids = take_first_n(bids_, depth);
        out.asks = take_first_n(asks_, depth);
        return out;
    }

    std::optional<std::pair<double,double>> best_bid() const {
        std::shared_lock lk(m_);
        if (bids_.empty()) return std::nullopt;
        return *bids_.begin();
    }
    std::optional<std::pair<double,double>> best_ask() const {
        std::shared_lock lk(m_);
        if (asks_.empty()) return std::nullopt;
        return *asks_.begin();
    }
    std::optional<double> level(BookSide side, double price) const {
        std::shared_lock lk(m_);
        if (side == BookSide::Bid) {
            auto it = bids_.find(price);
            if (it == bids_.end()) return std::nullopt;
            return it->second;
        }
        auto it = asks_.find(price);
        if (it == asks_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t bid_levels() const { std::shared_lock lk(m_); return bids_.size(); }
    std::size_t ask_levels() const { std::shared_lock lk(m_); return asks_.size(); }

    BookState state() const { std::shared_lock lk(m_); return state_; }
    std::uint64_t last_seq() const { std::shared_lock lk(m_); return last_seq_; }
    std::string anomaly_reason() const { std::shared_lock lk(m_); return anomaly_; }

    const std::string& symbol() const noexcept { return symbol_; }

private:
    using BidMap = std::map<double, double, std::greater<double>>; // best-first
    using AskMap = std::map<double, double, std::less<double>>;    // best-first

    // -------- unlocked helpers (caller holds m_) --------
    ApplyResult apply_unlocked(const BookSnapshot& snap) {
        if (state_ == BookState::Anomalous) return ApplyResult::Rejected;
        if (snap.symbol != symbol_) {
            return mark_anomalous("snapshot for unknown symbol '" + snap.symbol + "'");
        }
        bids_.clear();
        asks_.clear();
        for (const auto& lvl : snap.levels) {
            if (lvl.op == BookOp::Delete || lvl.size == 0.0) continue;
            if (lvl.side == BookSide::Bid) bids_[lvl.price] = lvl.size;
            else                           asks_[lvl.price] = lvl.size;
        }
        last_seq_ = snap.seq;
        last_first_seq_ = 0;
        return settle();
    }

    ApplyResult apply_unlocked(const BookDelta& d) {
        const ApplyResult r = apply_level(d);
        return r == ApplyResult::Applied ? settle() : r;
    }

    static bool continues_event(const BookDelta& d, const BookEvent* next) {
        if (!next || d.seq == 0) return false;
        const auto* n = std::get_if<BookDelta>(next);
        return n && n->symbol == d.symbol && n->seq == d.seq && n->first_seq == d.first_seq;
    }

    // Sequencing plus the level mutation; the caller settles the state.
    ApplyResult apply_level(const BookDelta& d) {
        if (state_ == BookState::Anomalous) return ApplyResult::Rejected;
        if (d.symbol != symbol_) {
            return mark_anomalous("delta for unknown symbol '" + d.symbol + "'");
        }

        if (d.seq) {
            const std::uint64_t first = d.first_seq ? d.first_seq : d.seq;
            const bool same_event = last_first_seq_ != 0 &&
                                    d.seq == last_seq_ && first == last_first_seq_;
            if (!same_event) {
                if (last_seq_ && d.seq <= last_seq_) return ApplyResult::Stale;
                if (last_seq_ == 0) {
                    return mark_anomalous("sequenced delta " + std::to_string(d.seq) +
                                          " without a base snapshot");
                }
                if (first > last_seq_ + 1) {
                    return mark_anomalous("sequence gap: expected " + std::to_string(last_seq_ + 1) +
                                          ", got " + std::to_string(first));
                }
                last_seq_ = d.seq;
                last_first_seq_ = first;
            }
        }

        if (d.side == BookSide::Bid) {
            apply_one(bids_, d);
        } else {
            apply_one(asks_, d);
        }
        return ApplyResult::Applied;
    }

    template <class OrderedMap>
    static void apply_one(OrderedMap& side, const BookDelta& d) {
        if (d.op == BookOp::Delete || d.size == 0.0) {
            side.erase(d.price); // absent level: no-op
        } else {
            side[d.price] = d.size;
        }
    }

    // Recompute the state tag after a successful mutation.
    ApplyResult settle() {
        if (bids_.empty() && asks_.empty()) {
            state_ = BookState::Empty;
        } else if (bids_.empty() || asks_.empty()) {
            state_ = BookState::Partial;
        } else if (bids_.begin()->first >= asks_.begin()->first) {
            return mark_anomalous("crossed book: best bid " + std::to_string(bids_.begin()->first) +
                                  " >= best ask " + std::to_string(asks_.begin()->first));
        } else {
            state_ = BookState::Consistent;
        }
        return ApplyResult::Applied;
    }

    ApplyResult mark_anomalous(std::string reason) {
        state_ = BookState::Anomalous;
        anomaly_ = std::move(reason);
        return ApplyResult::Anomaly;
    }

    template <class OrderedMap>
    static std::vector<std::pair<double,double>> take_first_n(const OrderedMap& m, std::size_t n) {
        std::vector<std::pair<double,double>> out;
        out.reserve(std::min(n, m.size()));
        std::size_t taken = 0;
        for (const auto& [px, sz] : m) {
            if (taken++ >= n) break;
            out.emplace_back(px, sz);
        }
        return out;
    }

    // -------- state --------
    std::string symbol_;

    mutable std::shared_mutex m_;
    BidMap bids_;
    AskMap asks_;
    BookState state_{BookState::Empty};
    std::string anomaly_;
    std::uint64_t last_seq_{0};       // 0 => no sequenced base
    std::uint64_t last_first_seq_{0}; // first_seq of the last applied event
};
