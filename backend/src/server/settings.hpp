#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

// Service-level knobs that are fixed for the process lifetime.
// Read from environment variables (optionally seeded from a .env file).
struct ServiceSettings {
    std::filesystem::path config_path{"config.json"};
    std::filesystem::path output_dir{"data"};
    std::size_t depth{20};
    std::chrono::milliseconds snapshot_interval{0}; // 0 => exchange default
    std::chrono::milliseconds config_poll{std::chrono::milliseconds(500)};
    std::size_t max_retries{5};
};

// Sets variables from KEY=VALUE lines; existing environment variables win.
// Silently does nothing if the file does not exist.
void load_env_file(const std::string& filepath = ".env");

// Throws FatalStartupError on a malformed numeric value.
ServiceSettings settings_from_env();
