#pragma once

#include <functional>
#include <string>

// Interface for a market-data WebSocket connector.
// start() blocks running the read loop; run it on its own thread.
// stop() requests a graceful close and unblocks start().
// OnMsg(json): called for each text frame from the exchange.
// OnError(what): called once if the connection ends for any reason other
// than stop().
// OnOpen(): called once the handshake is done, before the first frame.
struct IMarketWs {
    using OnMsg = std::function<void(const std::string &)>;
    using OnError = std::function<void(const std::string &)>;
    using OnOpen = std::function<void()>;
    virtual ~IMarketWs() = default;
    virtual void start(unsigned short port = 443) = 0;
    virtual void stop() noexcept = 0;
};
