#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "md/price_feed.hpp"

// Durable store for raw feeds and consensus history.
// Feeds are keyed by (symbol, source, timestamp): writing the same key again
// replaces the row. Failures throw StorageError.
class IFeedStore
{
public:
    virtual ~IFeedStore() = default;

    virtual void upsert_feed(const PriceFeed &feed) = 0;

    // from <= timestamp <= to, ascending by timestamp. Returns a copy.
    virtual std::vector<PriceFeed> feeds_between(const std::string &symbol,
                                                 Timestamp from, Timestamp to) const = 0;

    virtual std::optional<PriceFeed> latest_feed(const std::string &symbol) const = 0;

    // Keyed by (symbol, timestamp); a second record for the same key replaces the first.
    virtual void insert_consensus(const ConsensusRecord &rec) = 0;

    virtual std::optional<ConsensusRecord> latest_consensus(const std::string &symbol) const = 0;

    virtual std::size_t feed_count() const = 0;

    virtual std::vector<std::string> symbols() const = 0;

    virtual const char *kind() const = 0;
};

std::unique_ptr<IFeedStore> make_memory_feed_store();

// Connects, applies `schema_path` and keeps the connection string for per-call connections.
std::unique_ptr<IFeedStore> make_pg_feed_store(const std::string &connection_string,
                                               const std::string &schema_path);
