#include "venues/binance/ws.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct BinanceWs::Impl
{
    std::string host = "stream.binance.com";
    std::string stream;
    OnMsg on_msg;
    OnError on_error;
    OnOpen on_open;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    std::mutex ws_m; // guards `ws` between the reader thread and stop()
    std::unique_ptr<websocket::stream<beast::ssl_stream<tcp::socket>>> ws;
    std::atomic<bool> stop_flag{false};

    Impl(std::string s, OnMsg cb, OnError err, OnOpen open)
    : stream(std::move(s)), on_msg(std::move(cb)), on_error(std::move(err)), on_open(std::move(open))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    void run(unsigned short port)
    {
        std::string failure;
        try
        {
            tcp::resolver resolver{ioc};
            auto const results = resolver.resolve(host, std::to_string(port));

            {
                std::lock_guard<std::mutex> lk(ws_m);
                if (stop_flag.load(std::memory_order_relaxed)) return;
                ws = std::make_unique<websocket::stream<beast::ssl_stream<tcp::socket>>>(ioc, ssl_ctx);
            }

            // TCP connect
            net::connect(beast::get_lowest_layer(*ws), results);

            // SNI
            if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), host.c_str())) {
                throw beast::system_error{
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "SNI set failed"
                };
            }

            // TLS handshake
            ws->next_layer().handshake(net::ssl::stream_base::client);

            // WS handshake; the stream name is in the path, no subscribe message needed
            ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req){
                req.set(http::field::user_agent, "cex-book-collector/1.0");
            }));
            ws->handshake(host + ":" + std::to_string(port), "/ws/" + stream + "@depth@100ms");
            if (on_open) on_open();

            beast::flat_buffer buffer;
            while (!stop_flag.load(std::memory_order_relaxed))
            {
                buffer.clear();
                beast::error_code ec;
                ws->read(buffer, ec);
                if (ec)
                {
                    if (stop_flag.load(std::memory_order_relaxed)) break;
                    // Binance closes every connection after 24h; report it like any drop
                    throw beast::system_error{ec};
                }
                std::string data = beast::buffers_to_string(buffer.cdata());
                if (on_msg) on_msg(data);
            }

            beast::error_code close_ec;
            ws->close(websocket::close_code::normal, close_ec);
        }
        catch (const std::exception &e)
        {
            if (!stop_flag.load(std::memory_order_relaxed)) {
                failure = e.what();
            }
        }

        if (!failure.empty()) {
            std::cerr << "[binance-ws] " << stream << " error: " << failure << std::endl;
            if (on_error) on_error(failure);
        }
    }

    void stop() noexcept
    {
        stop_flag.store(true, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lk(ws_m);
        if (ws) {
            // Shutting the socket down unblocks the synchronous read in run().
            beast::error_code ec;
            beast::get_lowest_layer(*ws).shutdown(tcp::socket::shutdown_both, ec);
        }
    }
};

BinanceWs::BinanceWs(std::string stream, OnMsg cb, OnError on_error, OnOpen on_open)
    : impl_(new Impl(std::move(stream), std::move(cb), std::move(on_error), std::move(on_open))) {}

BinanceWs::~BinanceWs() { delete impl_; }

void BinanceWs::start(unsigned short port) { impl_->run(port); }
void BinanceWs::stop() noexcept { impl_->stop(); }
