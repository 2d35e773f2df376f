#pragma once
#include <spdlog/spdlog.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "cache/broadcaster.hpp"
#include "md/price_feed.hpp"

struct CachedFeed {
    PriceFeed feed;
    std::int64_t staleness_ms{0};
};

struct CachedConsensus {
    ConsensusRecord record;
    std::int64_t staleness_ms{0};
};

// Latest consensus and latest raw feed per source, per symbol.
// Staleness is computed against the caller's `now` on every read.
class PublishedPriceCache {
public:
    PublishedPriceCache(std::shared_ptr<PriceBroadcaster> broadcaster,
                        std::shared_ptr<spdlog::logger> log);

    // Replaces the symbol's record and fans it out to subscribers.
    void publish(const ConsensusRecord &rec);

    // Keeps the newest feed per (symbol, source); older timestamps are ignored.
    void update_feed(const PriceFeed &feed);

    // Pushes an accepted raw feed to subscribers as a price update.
    void broadcast_feed(const PriceFeed &feed);

    std::optional<CachedConsensus> consensus(const std::string &symbol, Timestamp now = now_ts()) const;
    std::vector<CachedFeed> latest_feeds(const std::string &symbol, Timestamp now = now_ts()) const;

    std::vector<std::string> symbols() const;

    const std::shared_ptr<PriceBroadcaster> &broadcaster() const { return broadcaster_; }

private:
    struct Entry {
        std::optional<ConsensusRecord> consensus;
        std::map<std::string, PriceFeed> by_source;
    };

    std::shared_ptr<PriceBroadcaster> broadcaster_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::shared_mutex mtx_;
    std::map<std::string, Entry> entries_;
};
