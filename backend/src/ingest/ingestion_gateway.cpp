#include "ingest/ingestion_gateway.hpp"
#include "md/symbol_codec.hpp"
#include "util/decimal.hpp"
#include "util/errors.hpp"

#include <map>
#include <set>

namespace
{
    // ^[a-z0-9_-]{1,max}$
    bool is_slug(const std::string &s, std::size_t max_len)
    {
        if (s.empty() || s.size() > max_len) return false;
        for (char ch : s) {
            const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
            if (!ok) return false;
        }
        return true;
    }

    constexpr const char *kIngestionsMetric = "price_ingestions_total";
    constexpr const char *kDurationMetric = "price_ingestion_duration_ms";

    std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    }
}

IngestionGateway::IngestionGateway(std::shared_ptr<IFeedStore> store,
                                   std::shared_ptr<PublishedPriceCache> cache,
                                   std::shared_ptr<spdlog::logger> log,
                                   GatewayOptions opts,
                                   std::shared_ptr<MetricsRegistry> metrics)
    : store_(std::move(store)), cache_(std::move(cache)), log_(std::move(log)), opts_(opts),
      metrics_(std::move(metrics))
{
    if (!store_) throw ConfigError("IngestionGateway needs a feed store");
    if (metrics_) {
        metrics_->add_counter(kIngestionsMetric, "Total number of price feeds ingested");
        metrics_->add_histogram(kDurationMetric, "Price ingestion duration in milliseconds",
                                {10, 25, 50, 100, 250, 500, 1000});
    }
}

// One increment per feed: status is success, failed, or rejected for a bad batch.
void IngestionGateway::record_metrics(const IngestBatch &batch, const IngestResult &res) const
{
    if (!metrics_) return;
    std::set<std::size_t> failed;
    for (const auto &e : res.errors) failed.insert(e.index);
    const bool rejected = res.status == IngestStatus::Error && res.errors.empty();
    for (std::size_t i = 0; i < batch.feeds.size(); ++i) {
        const char *status = rejected ? "rejected" : failed.count(i) ? "failed" : "success";
        metrics_->inc(kIngestionsMetric, {{"worker_id", batch.worker_id},
                                          {"symbol", batch.feeds[i].symbol},
                                          {"status", status}});
    }
    metrics_->observe(kDurationMetric, {{"worker_id", batch.worker_id}}, static_cast<double>(res.latency_ms));
}

std::optional<std::string> IngestionGateway::check_shape(const IngestBatch &batch)
{
    if (batch.worker_id.empty()) return "worker_id is required";
    if (!is_slug(batch.worker_id, 100)) {
        return "worker_id must be 1-100 chars of lowercase alphanumerics, hyphens or underscores";
    }
    if (batch.feeds.empty()) return "at least one price feed required";
    if (batch.feeds.size() > kMaxBatchFeeds) {
        return "maximum " + std::to_string(kMaxBatchFeeds) + " price feeds per batch, got " +
               std::to_string(batch.feeds.size());
    }
    return std::nullopt;
}

std::optional<std::string> IngestionGateway::check_feed(const PriceFeed &feed, Timestamp now,
                                                        std::chrono::milliseconds max_future_skew)
{
    if (feed.symbol.size() < 5 || feed.symbol.size() > 20 || !SymbolCodec::is_canonical(feed.symbol)) {
        return "symbol must be in format BASE/QUOTE (e.g. BTC/USD)";
    }
    auto price = Decimal::parse(feed.price);
    if (!price) return "price must be a decimal number as string";
    if (!price->positive()) return "price must be greater than 0";
    if (feed.volume && !Decimal::is_plain(*feed.volume)) {
        return "volume must be a non-negative decimal number as string";
    }
    if (!is_slug(feed.source, 50)) {
        return "source must be 1-50 chars of lowercase alphanumerics, hyphens or underscores";
    }
    if (feed.timestamp > now + max_future_skew) return "timestamp is in the future";
    return std::nullopt;
}

IngestResult IngestionGateway::ingest(const IngestBatch &batch) const
{
    const auto started = std::chrono::steady_clock::now();
    IngestResult res;

    if (auto reason = check_shape(batch)) {
        res.status = IngestStatus::Error;
        res.ingested = 0;
        res.failed = batch.feeds.size();
        res.message = *reason;
        res.latency_ms = elapsed_ms(started);
        log_->warn("batch rejected worker={} feeds={} reason={}", batch.worker_id, batch.feeds.size(), *reason);
        record_metrics(batch, res);
        return res;
    }

    const Timestamp now = now_ts();
    std::map<std::string, PriceFeed> newest; // per symbol, for the stream
    for (std::size_t i = 0; i < batch.feeds.size(); ++i) {
        PriceFeed feed = batch.feeds[i];
        feed.worker_id = batch.worker_id;

        try {
            if (auto bad = batch.malformed.find(i); bad != batch.malformed.end()) {
                throw ValidationError(bad->second);
            }
            if (auto reason = check_feed(feed, now, opts_.max_future_skew)) throw ValidationError(*reason);
            store_->upsert_feed(feed);
        } catch (const ValidationError &e) {
            res.errors.push_back(IngestItemError{i, feed.symbol, e.what()});
            continue;
        } catch (const StorageError &e) {
            log_->error("store failed worker={} index={} symbol={} error={}", batch.worker_id, i, feed.symbol, e.what());
            res.errors.push_back(IngestItemError{i, feed.symbol, e.what()});
            continue;
        }
        ++res.ingested;
        if (cache_) cache_->update_feed(feed);
        auto slot = newest.find(feed.symbol);
        if (slot == newest.end()) newest.emplace(feed.symbol, feed);
        else if (feed.timestamp > slot->second.timestamp) slot->second = feed;
    }
    if (cache_) {
        for (const auto &kv : newest) cache_->broadcast_feed(kv.second);
    }

    res.failed = res.errors.size();
    if (res.failed == 0) {
        res.status = IngestStatus::Success;
        res.message = std::to_string(res.ingested) + " price feeds ingested successfully";
    } else if (res.ingested > 0) {
        res.status = IngestStatus::Partial;
        res.message = std::to_string(res.ingested) + " of " + std::to_string(batch.feeds.size()) +
                      " price feeds ingested";
    } else {
        res.status = IngestStatus::Error;
        res.message = "no price feeds ingested";
    }
    res.latency_ms = elapsed_ms(started);

    log_->info("ingest worker={} feeds={} ingested={} failed={} latency_ms={}",
               batch.worker_id, batch.feeds.size(), res.ingested, res.failed, res.latency_ms);
    record_metrics(batch, res);
    return res;
}
