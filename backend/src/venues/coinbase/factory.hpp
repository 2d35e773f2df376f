#pragma once

#include "venues/venue_factory.hpp"
#include "venues/coinbase/adapter.hpp"

inline VenueFactory make_coinbase_factory() {
    VenueFactory factory;
    factory.name = "coinbase";
    factory.make_adapter = [](std::vector<std::string> symbols, std::string worker_id)
        -> std::unique_ptr<IExchangeAdapter> {
        return std::make_unique<CoinbaseAdapter>(std::move(symbols), std::move(worker_id));
    };
    return factory;
}
