#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "venue_factory.hpp"
#include "binance/factory.hpp"
#include "coinbase/factory.hpp"
#include "kraken/factory.hpp"
#include "util/errors.hpp"

class VenueRegistry {
public:
    static const VenueRegistry& instance() {
        static VenueRegistry registry;
        return registry;
    }

    const VenueFactory* find(std::string_view name) const {
        auto it = factories_.find(std::string(name));
        if (it == factories_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    std::vector<std::string> list_names() const {
        std::vector<std::string> names;
        names.reserve(factories_.size());
        for (const auto& kv : factories_) {
            names.push_back(kv.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    // Throws ConfigError for unknown exchanges or symbols the adapter rejects.
    std::unique_ptr<IExchangeAdapter> make_adapter(std::string_view name,
                                                   std::vector<std::string> symbols,
                                                   std::string worker_id) const {
        const VenueFactory* factory = find(name);
        if (!factory) {
            throw ConfigError("unknown exchange '" + std::string(name) + "'");
        }
        return factory->make_adapter(std::move(symbols), std::move(worker_id));
    }

private:
    VenueRegistry() {
        register_factory(make_binance_factory());
        register_factory(make_coinbase_factory());
        register_factory(make_kraken_factory());
    }

    void register_factory(VenueFactory factory) {
        if (factory.name.empty() || !factory.make_adapter) {
            return;
        }
        factories_.emplace(factory.name, std::move(factory));
    }

    std::unordered_map<std::string, VenueFactory> factories_;
};
