#pragma once
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cache/price_cache.hpp"
#include "md/price_feed.hpp"
#include "storage/feed_store.hpp"

struct AggregatorOptions {
    // Empty: every symbol the cache has seen.
    std::vector<std::string> symbols;
    std::chrono::milliseconds window{10000};
    std::chrono::milliseconds interval{5000};
    std::size_t minimum_sources{1};
};

// Reduces recent per-source feeds into one ConsensusRecord per symbol.
// Runs on its own cadence thread; run_cycle() can also be called directly.
class ConsensusAggregator {
public:
    ConsensusAggregator(std::shared_ptr<IFeedStore> store,
                        std::shared_ptr<PublishedPriceCache> cache,
                        AggregatorOptions opts,
                        std::shared_ptr<spdlog::logger> log);
    ~ConsensusAggregator();

    ConsensusAggregator(const ConsensusAggregator &) = delete;
    ConsensusAggregator &operator=(const ConsensusAggregator &) = delete;

    // Last value per source, then median/mean/population std-dev over those
    // prices. nullopt below `minimum_sources` distinct sources or when no
    // price parses.
    static std::optional<ConsensusRecord> compute(const std::string &symbol,
                                                  const std::vector<PriceFeed> &feeds,
                                                  std::size_t minimum_sources);

    // One pass over all symbols using the window ending at `as_of`.
    // Returns the records that were published.
    std::vector<ConsensusRecord> run_cycle(Timestamp as_of = now_ts());

    void start();
    void stop();

private:
    void loop();
    std::vector<std::string> cycle_symbols() const;

    std::shared_ptr<IFeedStore> store_;
    std::shared_ptr<PublishedPriceCache> cache_;
    AggregatorOptions opts_;
    std::shared_ptr<spdlog::logger> log_;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool running_{false};
    std::thread worker_;
};
