#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <thread>

#include "server/collector_service.hpp"
#include "server/settings.hpp"
#include "util/errors.hpp"

int main() {
    load_env_file();

    ServiceSettings settings;
    try {
        settings = settings_from_env();
    } catch (const FatalStartupError& e) {
        std::cerr << "[service] fatal: " << e.what() << std::endl;
        return 1;
    }

    CancelToken cancel;

    // SIGINT/SIGTERM request a cooperative shutdown of every collector.
    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&cancel](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cout << "[service] Signal " << signo << " received; stopping" << std::endl;
        cancel.cancel();
    });
    std::thread signal_thread([&ioc] { ioc.run(); });

    const int rc = run_collector_service(settings, cancel);

    ioc.stop();
    signal_thread.join();
    return rc;
}
