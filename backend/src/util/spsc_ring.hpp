#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <utility>

// Bounded single-producer / single-consumer ring.
// - CapacityPow2 must be a power of two; one slot stays unused so that
//   head == tail always means empty.
// - Exactly one thread calls try_push, exactly one thread calls try_pop.
// Used for raw exchange frames (socket thread -> collector thread) and for
// Config events (watcher thread -> orchestrator thread).
template <typename T, std::size_t CapacityPow2>
class SpscRing {
    static_assert(CapacityPow2 >= 2, "Capacity must hold at least one element");
    static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be power of two");

public:
    SpscRing() = default;
    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer side. Returns false when full; the caller picks the policy.
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & mask_;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[head] = std::move(v);
        head_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side. Returns false when empty.
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(slots_[tail]);
        slots_[tail] = T{};
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    // Consumer side: discard everything currently queued.
    std::size_t drain() {
        std::size_t dropped = 0;
        T trash;
        while (try_pop(trash)) ++dropped;
        return dropped;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

private:
    static constexpr std::size_t mask_ = CapacityPow2 - 1;
    std::array<T, CapacityPow2> slots_{};
    std::atomic<std::size_t> head_{0}; // producer writes
    std::atomic<std::size_t> tail_{0}; // consumer writes
};
