#pragma once
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

#include "md/depth_snapshot.hpp"

// Writes one JSON file per symbol under <root>/<EXCHANGE>/<SYMBOL>.json.
// Each write goes to a unique temp file in the same directory, is fsync'd,
// then renamed over the target, so readers see either the old or the new
// content in full. Distinct symbols never share a path. Thread-safe.
class Persister {
public:
    explicit Persister(std::filesystem::path root);

    // Throws PersistenceError; the temp file is removed on failure.
    void write(const DepthSnapshot& snap);

    // Current content for a symbol, or nullopt if it was never written.
    // Throws PersistenceError if the file exists but cannot be decoded.
    std::optional<DepthSnapshot> read(const std::string& exchange, const std::string& symbol) const;

    std::filesystem::path path_for(const std::string& exchange, const std::string& symbol) const;

    static std::string encode(const DepthSnapshot& snap);
    static DepthSnapshot decode(const std::string& text);

private:
    std::filesystem::path root_;
    std::atomic<std::uint64_t> tmp_seq_{0};
};
