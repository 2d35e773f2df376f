#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

class IExchangeAdapter;

struct VenueFactory {
    std::string name;
    std::function<std::unique_ptr<IExchangeAdapter>(std::vector<std::string> symbols,
                                                    std::string worker_id)> make_adapter;
};
