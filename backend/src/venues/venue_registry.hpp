#pragma once

#include <unordered_map>

#include "venue_factory.hpp"
#include "binance/factory.hpp"
#include "bitkub/factory.hpp"

// Immutable lookup from the closed Exchange set to its factory.
class VenueRegistry {
public:
    static const VenueRegistry& instance() {
        static const VenueRegistry registry;
        return registry;
    }

    const VenueFactory* find(Exchange exchange) const {
        auto it = factories_.find(exchange);
        if (it == factories_.end()) {
            return nullptr;
        }
        return &it->second;
    }

private:
    VenueRegistry() {
        register_factory(make_binance_factory());
        register_factory(make_bitkub_factory());
    }

    void register_factory(VenueFactory factory) {
        if (factory.name.empty() ||
            !factory.make_feed ||
            !factory.to_venue_symbol) {
            return;
        }
        factories_.emplace(factory.exchange, std::move(factory));
    }

    std::unordered_map<Exchange, VenueFactory> factories_;
};
