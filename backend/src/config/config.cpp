#include "config/config.hpp"
#include "md/symbol_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

Config parse_config(const std::string& text, const ConfigWarningSink& warn) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    auto cex_it = j.find("cex");
    if (cex_it == j.end() || !cex_it->is_string()) {
        throw ConfigError("config field 'cex' must be a string");
    }
    auto tickers_it = j.find("tickers");
    if (tickers_it == j.end() || !tickers_it->is_array()) {
        throw ConfigError("config field 'tickers' must be an array");
    }

    const auto cex = cex_it->get<std::string>();
    const auto exchange = parse_exchange(cex);
    if (!exchange) {
        throw ConfigError("unsupported cex '" + cex + "'");
    }

    Config cfg;
    cfg.exchange = *exchange;
    for (const auto& item : *tickers_it) {
        if (!item.is_string()) {
            throw ConfigError("config 'tickers' entries must be strings");
        }
        const auto symbol = item.get<std::string>();
        if (!Ticker::parse(symbol)) {
            const std::string msg = "Invalid symbol format: " + symbol;
            if (warn) warn(msg);
            else std::cerr << "[config] " << msg << "; skipping." << std::endl;
            continue;
        }
        cfg.tickers.insert(symbol);
    }
    return cfg;
}

std::string read_config_text(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Config load_config(const std::filesystem::path& path, const ConfigWarningSink& warn) {
    return parse_config(read_config_text(path), warn);
}
