#pragma once
#include <stdexcept>
#include <string>

// Error taxonomy for the collector. Everything derives from std::runtime_error
// so callers at thread boundaries can log e.what() uniformly.

// Malformed config file or an unsupported change (e.g. switching exchange).
// Recoverable: the last good Config is retained.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Connection drop, protocol violation, stale stream. Recoverable via reconnect.
struct FeedError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Crossed or out-of-sequence book. Recoverable via resync.
struct BookConsistencyError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Snapshot could not be written. The snapshot is skipped.
struct PersistenceError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Invalid initial config or settings. The service exits non-zero.
struct FatalStartupError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
