#include "server/collector_service.hpp"

#include "config/config_watcher.hpp"
#include "md/exchange_feed.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/persister.hpp"
#include "util/errors.hpp"
#include "venues/venue_registry.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

int run_collector_service(const ServiceSettings& settings, const CancelToken& cancel) {
    try {
        ConfigWatcher::Options wopts;
        wopts.poll_interval = settings.config_poll;
        ConfigWatcher watcher(settings.config_path, wopts);

        const Config initial = watcher.load_initial();

        const VenueFactory* factory = VenueRegistry::instance().find(initial.exchange);
        if (!factory) {
            throw FatalStartupError(std::string("no venue registered for ") + to_string(initial.exchange));
        }

        FeedSettings feed_settings;
        feed_settings.poll_interval = settings.snapshot_interval;
        feed_settings.depth = settings.depth;

        Orchestrator::Options opts;
        opts.collector.depth = settings.depth;
        opts.collector.max_retries = settings.max_retries;
        opts.collector.snapshot_interval = settings.snapshot_interval.count() > 0
            ? settings.snapshot_interval
            : factory->default_interval;

        // An unusable output root is a startup failure.
        std::filesystem::create_directories(settings.output_dir);
        auto persister = std::make_shared<Persister>(settings.output_dir);
        Orchestrator orchestrator(
            initial.exchange,
            [factory, feed_settings](const Ticker& ticker) {
                return factory->make_feed(ticker, feed_settings);
            },
            persister,
            opts);

        std::cout << "[service] Collecting " << factory->name << " order books into "
                  << settings.output_dir.string() << std::endl;
        orchestrator.run(watcher, cancel);
        std::cout << "[service] Clean shutdown" << std::endl;
        return 0;
    } catch (const FatalStartupError& e) {
        std::cerr << "[service] fatal: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[service] fatal: unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
