#include "collector/connection_manager.hpp"
#include "util/logging.hpp"
#include "venues/venue_registry.hpp"
#include "ws/ws.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Connects to every registered exchange for ~20 seconds and prints the
// normalized feeds. Needs network access; not part of the unit tests.
int main(int argc, char **argv)
{
    init_logging("info");
    const int seconds = argc > 1 ? std::atoi(argv[1]) : 20;

    std::mutex io_mtx;
    auto print_feed = [&](PriceFeed f) {
        std::lock_guard<std::mutex> lk(io_mtx);
        std::cout << f.source << " " << f.symbol
                  << " price=" << f.price
                  << " volume=" << f.volume.value_or("-")
                  << " ts=" << format_iso8601(f.timestamp) << "\n";
    };

    const auto &registry = VenueRegistry::instance();
    std::vector<std::unique_ptr<ConnectionManager>> connections;
    for (const auto &name : registry.list_names()) {
        connections.push_back(std::make_unique<ConnectionManager>(
            registry.make_adapter(name, {"BTC/USD", "ETH/USD"}, "worker-live-smoke"),
            std::make_unique<BeastWsTransport>(),
            print_feed,
            ReconnectPolicy{},
            make_logger("conn." + name)));
    }
    for (auto &c : connections) c->connect();

    std::this_thread::sleep_for(std::chrono::seconds(seconds));

    for (auto &c : connections) {
        c->disconnect();
        const auto s = c->status();
        std::cout << s.exchange << ": connects=" << s.connects
                  << " messages=" << s.messages
                  << " feeds=" << s.feeds
                  << " parse_errors=" << s.parse_errors << "\n";
    }
    shutdown_logging();
    return 0;
}

/*
./build/live_collector 30
*/
