#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <string>

#include "md/exchange.hpp"
#include "util/errors.hpp"

// Desired collection state: one exchange (fixed for the process lifetime)
// and the set of canonical tickers to collect.
struct Config {
    Exchange exchange{Exchange::Binance};
    std::set<std::string> tickers;

    bool operator==(const Config&) const = default;
};

// Receives entries that were skipped while parsing (e.g. bad tickers).
using ConfigWarningSink = std::function<void(const std::string&)>;

// Parses `{ "cex": "<BINANCE|BITKUB>", "tickers": ["BTC_USDT", ...] }`.
// Throws ConfigError on malformed JSON, missing/mistyped fields or an
// unsupported exchange. Tickers that are not BASE_QUOTE are skipped and
// reported to `warn` (logged when no sink is given).
Config parse_config(const std::string& text, const ConfigWarningSink& warn = {});

// Reads and parses the file; an unreadable file is a ConfigError.
Config load_config(const std::filesystem::path& path, const ConfigWarningSink& warn = {});

// Reads a whole file; throws ConfigError if it cannot be opened.
std::string read_config_text(const std::filesystem::path& path);
