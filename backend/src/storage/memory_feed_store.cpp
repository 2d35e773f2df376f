#include "storage/feed_store.hpp"

#include <iterator>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace
{
    using FeedKey = std::pair<std::int64_t, std::string>; // (epoch ms, source)
}

class MemoryFeedStore final : public IFeedStore
{
    mutable std::shared_mutex mtx_;
    std::map<std::string, std::map<FeedKey, PriceFeed>> feeds_;
    std::map<std::string, std::map<std::int64_t, ConsensusRecord>> consensus_;
    std::size_t count_{0};

public:
    void upsert_feed(const PriceFeed &feed) override
    {
        std::unique_lock lk(mtx_);
        auto &rows = feeds_[feed.symbol];
        auto [it, inserted] = rows.insert_or_assign(FeedKey{ts_to_ms(feed.timestamp), feed.source}, feed);
        (void)it;
        if (inserted) ++count_;
    }

    std::vector<PriceFeed> feeds_between(const std::string &symbol,
                                         Timestamp from, Timestamp to) const override
    {
        std::shared_lock lk(mtx_);
        std::vector<PriceFeed> out;
        auto sit = feeds_.find(symbol);
        if (sit == feeds_.end() || to < from) return out;
        const auto &rows = sit->second;
        auto it = rows.lower_bound(FeedKey{ts_to_ms(from), std::string()});
        for (; it != rows.end() && it->first.first <= ts_to_ms(to); ++it) {
            out.push_back(it->second);
        }
        return out;
    }

    std::optional<PriceFeed> latest_feed(const std::string &symbol) const override
    {
        std::shared_lock lk(mtx_);
        auto sit = feeds_.find(symbol);
        if (sit == feeds_.end() || sit->second.empty()) return std::nullopt;
        return std::prev(sit->second.end())->second;
    }

    void insert_consensus(const ConsensusRecord &rec) override
    {
        std::unique_lock lk(mtx_);
        consensus_[rec.symbol].insert_or_assign(ts_to_ms(rec.timestamp), rec);
    }

    std::optional<ConsensusRecord> latest_consensus(const std::string &symbol) const override
    {
        std::shared_lock lk(mtx_);
        auto it = consensus_.find(symbol);
        if (it == consensus_.end() || it->second.empty()) return std::nullopt;
        return std::prev(it->second.end())->second;
    }

    std::size_t feed_count() const override
    {
        std::shared_lock lk(mtx_);
        return count_;
    }

    std::vector<std::string> symbols() const override
    {
        std::shared_lock lk(mtx_);
        std::vector<std::string> out;
        out.reserve(feeds_.size());
        for (const auto &kv : feeds_) out.push_back(kv.first);
        return out;
    }

    const char *kind() const override { return "memory"; }
};

std::unique_ptr<IFeedStore> make_memory_feed_store() { return std::make_unique<MemoryFeedStore>(); }
