#include "cache/price_cache.hpp"

#include <mutex>

namespace
{
    std::int64_t staleness(Timestamp now, Timestamp ts)
    {
        return (now - ts).count();
    }
}

PublishedPriceCache::PublishedPriceCache(std::shared_ptr<PriceBroadcaster> broadcaster,
                                         std::shared_ptr<spdlog::logger> log)
    : broadcaster_(std::move(broadcaster)), log_(std::move(log))
{
}

void PublishedPriceCache::publish(const ConsensusRecord &rec)
{
    {
        std::unique_lock lk(mtx_);
        entries_[rec.symbol].consensus = rec;
    }
    log_->debug("consensus published symbol={} price={} sources={}", rec.symbol, rec.price, rec.num_sources);
    if (broadcaster_) broadcaster_->publish(rec);
}

void PublishedPriceCache::update_feed(const PriceFeed &feed)
{
    std::unique_lock lk(mtx_);
    auto &slot = entries_[feed.symbol].by_source;
    auto it = slot.find(feed.source);
    if (it == slot.end()) {
        slot.emplace(feed.source, feed);
    } else if (feed.timestamp >= it->second.timestamp) {
        it->second = feed;
    }
}

void PublishedPriceCache::broadcast_feed(const PriceFeed &feed)
{
    if (broadcaster_) broadcaster_->publish(feed);
}

std::optional<CachedConsensus> PublishedPriceCache::consensus(const std::string &symbol, Timestamp now) const
{
    std::shared_lock lk(mtx_);
    auto it = entries_.find(symbol);
    if (it == entries_.end() || !it->second.consensus) return std::nullopt;
    const auto &rec = *it->second.consensus;
    return CachedConsensus{rec, staleness(now, rec.timestamp)};
}

std::vector<CachedFeed> PublishedPriceCache::latest_feeds(const std::string &symbol, Timestamp now) const
{
    std::shared_lock lk(mtx_);
    std::vector<CachedFeed> out;
    auto it = entries_.find(symbol);
    if (it == entries_.end()) return out;
    out.reserve(it->second.by_source.size());
    for (const auto &kv : it->second.by_source) {
        out.push_back(CachedFeed{kv.second, staleness(now, kv.second.timestamp)});
    }
    return out;
}

std::vector<std::string> PublishedPriceCache::symbols() const
{
    std::shared_lock lk(mtx_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &kv : entries_) out.push_back(kv.first);
    return out;
}
