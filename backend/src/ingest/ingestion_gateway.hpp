#pragma once
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "cache/price_cache.hpp"
#include "md/price_feed.hpp"
#include "storage/feed_store.hpp"
#include "util/metrics.hpp"

struct GatewayOptions {
    // Feeds stamped further than this into the future are rejected.
    std::chrono::milliseconds max_future_skew{std::chrono::minutes(5)};
};

// Validates and persists inbound batches with per-item accounting.
// Accepted feeds refresh the cache, and the newest accepted feed per symbol
// is streamed as a price update.
// Holds no mutable state of its own; concurrent ingest() calls are safe.
class IngestionGateway {
public:
    IngestionGateway(std::shared_ptr<IFeedStore> store,
                     std::shared_ptr<PublishedPriceCache> cache,
                     std::shared_ptr<spdlog::logger> log,
                     GatewayOptions opts = {},
                     std::shared_ptr<MetricsRegistry> metrics = nullptr);

    IngestResult ingest(const IngestBatch &batch) const;

    // Reason the batch as a whole is unacceptable, or nullopt.
    static std::optional<std::string> check_shape(const IngestBatch &batch);
    // Reason one feed is unacceptable, or nullopt.
    static std::optional<std::string> check_feed(const PriceFeed &feed, Timestamp now,
                                                 std::chrono::milliseconds max_future_skew);

private:
    void record_metrics(const IngestBatch &batch, const IngestResult &res) const;

    std::shared_ptr<IFeedStore> store_;
    std::shared_ptr<PublishedPriceCache> cache_;
    std::shared_ptr<spdlog::logger> log_;
    GatewayOptions opts_;
    std::shared_ptr<MetricsRegistry> metrics_;
};
