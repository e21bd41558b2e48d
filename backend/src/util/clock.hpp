#pragma once
#include <chrono>
#include <cstdint>

inline std::int64_t wall_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Milliseconds until the next wall-clock multiple of `interval_ms`.
inline std::int64_t ms_to_next_boundary(std::int64_t now_ms, std::int64_t interval_ms) {
    if (interval_ms <= 0) return 0;
    const std::int64_t rem = now_ms % interval_ms;
    return rem == 0 ? interval_ms : interval_ms - rem;
}
