#pragma once

#include "venues/venue_factory.hpp"
#include "venues/kraken/adapter.hpp"

inline VenueFactory make_kraken_factory() {
    VenueFactory factory;
    factory.name = "kraken";
    factory.make_adapter = [](std::vector<std::string> symbols, std::string worker_id)
        -> std::unique_ptr<IExchangeAdapter> {
        return std::make_unique<KrakenAdapter>(std::move(symbols), std::move(worker_id));
    };
    return factory;
}
