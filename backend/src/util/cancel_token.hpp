#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// One-way cancellation signal shared between an owner and a worker.
// Copies share state; the worker only ever observes it.
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lk(state_->m);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    bool cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    // Sleeps up to `d`; returns true as soon as the token is cancelled.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lk(state_->m);
        return state_->cv.wait_for(lk, d, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex m;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};
