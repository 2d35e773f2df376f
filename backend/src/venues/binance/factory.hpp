#pragma once

#include "venues/venue_factory.hpp"
#include "venues/binance/adapter.hpp"

inline VenueFactory make_binance_factory() {
    VenueFactory factory;
    factory.name = "binance";
    factory.make_adapter = [](std::vector<std::string> symbols, std::string worker_id)
        -> std::unique_ptr<IExchangeAdapter> {
        return std::make_unique<BinanceAdapter>(std::move(symbols), std::move(worker_id));
    };
    return factory;
}
