#include "server/settings.hpp"
#include "util/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
    return s;
}

std::size_t env_size(const char* key, std::size_t fallback) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw) return fallback;
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(raw, &pos);
        if (pos != std::string(raw).size() || v < 0) throw std::invalid_argument(raw);
        return static_cast<std::size_t>(v);
    } catch (const std::logic_error&) {
        throw FatalStartupError(std::string(key) + " must be a non-negative integer, got '" + raw + "'");
    }
}

} // namespace

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return; // .env file not found, will use system env vars
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
}

ServiceSettings settings_from_env() {
    ServiceSettings s;
    if (const char* p = std::getenv("COLLECTOR_CONFIG"); p && *p) s.config_path = p;
    if (const char* p = std::getenv("COLLECTOR_OUTPUT_DIR"); p && *p) s.output_dir = p;
    s.depth = env_size("COLLECTOR_DEPTH", s.depth);
    s.snapshot_interval = std::chrono::milliseconds(env_size("COLLECTOR_SNAPSHOT_MS", 0));
    s.config_poll = std::chrono::milliseconds(
        env_size("COLLECTOR_CONFIG_POLL_MS", static_cast<std::size_t>(s.config_poll.count())));
    s.max_retries = env_size("COLLECTOR_MAX_RETRIES", s.max_retries);

    if (s.depth == 0) throw FatalStartupError("COLLECTOR_DEPTH must be positive");
    if (s.config_poll.count() == 0) throw FatalStartupError("COLLECTOR_CONFIG_POLL_MS must be positive");
    return s;
}
