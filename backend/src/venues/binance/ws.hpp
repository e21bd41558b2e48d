#pragma once

#include <string>

#include "venues/market_ws.hpp"

// Binance diff-depth stream: wss://stream.binance.com:9443/ws/<stream>@depth@100ms
// NOTE: Uses a PIMPL to hide Boost headers from dependents.
class BinanceWs : public IMarketWs {
public:
    // stream like "btcusdt"
    BinanceWs(std::string stream, OnMsg cb, OnError on_error, OnOpen on_open = {});
    ~BinanceWs();
    BinanceWs(const BinanceWs &) = delete;
    BinanceWs &operator=(const BinanceWs &) = delete;

    void start(unsigned short port = 9443) override;
    void stop() noexcept override;

private:
    struct Impl;
    Impl *impl_;
};
