#include "consensus/consensus_aggregator.hpp"
#include "util/decimal.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <map>

ConsensusAggregator::ConsensusAggregator(std::shared_ptr<IFeedStore> store,
                                         std::shared_ptr<PublishedPriceCache> cache,
                                         AggregatorOptions opts,
                                         std::shared_ptr<spdlog::logger> log)
    : store_(std::move(store)), cache_(std::move(cache)), opts_(std::move(opts)), log_(std::move(log))
{
    if (!store_ || !cache_) throw ConfigError("ConsensusAggregator needs a store and a cache");
    if (opts_.minimum_sources == 0) opts_.minimum_sources = 1;
    if (opts_.window.count() <= 0) throw ConfigError("consensus window must be positive");
    if (opts_.interval.count() <= 0) throw ConfigError("consensus interval must be positive");
}

ConsensusAggregator::~ConsensusAggregator()
{
    stop();
}

std::optional<ConsensusRecord> ConsensusAggregator::compute(const std::string &symbol,
                                                            const std::vector<PriceFeed> &feeds,
                                                            std::size_t minimum_sources)
{
    // later entries win ties on timestamp
    std::map<std::string, const PriceFeed *> latest;
    for (const auto &f : feeds) {
        auto &slot = latest[f.source];
        if (slot == nullptr || f.timestamp >= slot->timestamp) slot = &f;
    }

    ConsensusRecord rec;
    rec.symbol = symbol;
    std::vector<Decimal> prices;
    prices.reserve(latest.size());
    int scale = 0; // widest input fraction
    for (const auto &kv : latest) {
        auto p = Decimal::parse(kv.second->price);
        if (!p || !p->positive()) continue;
        prices.push_back(*p);
        scale = std::max(scale, Decimal::fraction_digits(kv.second->price));
        rec.sources.insert(kv.first);
        if (kv.second->timestamp > rec.timestamp) rec.timestamp = kv.second->timestamp;
    }

    const std::size_t n = prices.size();
    if (n == 0 || n < minimum_sources) return std::nullopt;
    rec.num_sources = n;

    std::sort(prices.begin(), prices.end());
    const Decimal count(static_cast<long long>(n));
    // median is unrounded: an input price, or a midpoint needing one more digit
    if (n % 2 == 1) {
        rec.median = prices[n / 2].str(scale);
    } else {
        rec.median = ((prices[n / 2 - 1] + prices[n / 2]) / Decimal(2)).str(scale + 1);
    }

    Decimal sum;
    for (const auto &p : prices) sum += p;
    const Decimal mean = sum / count;

    rec.price = rec.median;
    rec.mean = mean.str();

    if (n >= 2) {
        Decimal sq;
        for (const auto &p : prices) {
            const Decimal d = p - mean;
            sq += d * d;
        }
        rec.std_dev = (sq / count).sqrt().str();
    }
    return rec;
}

std::vector<std::string> ConsensusAggregator::cycle_symbols() const
{
    if (!opts_.symbols.empty()) return opts_.symbols;
    return cache_->symbols();
}

std::vector<ConsensusRecord> ConsensusAggregator::run_cycle(Timestamp as_of)
{
    std::vector<ConsensusRecord> published;
    const Timestamp from = as_of - opts_.window;

    for (const auto &symbol : cycle_symbols()) {
        std::vector<PriceFeed> snapshot;
        try {
            snapshot = store_->feeds_between(symbol, from, as_of);
        } catch (const StorageError &e) {
            log_->error("snapshot read failed symbol={} error={}", symbol, e.what());
            continue;
        }

        auto rec = compute(symbol, snapshot, opts_.minimum_sources);
        if (!rec) {
            log_->debug("no consensus symbol={} feeds={} minimum_sources={}",
                        symbol, snapshot.size(), opts_.minimum_sources);
            continue;
        }

        try {
            store_->insert_consensus(*rec);
        } catch (const StorageError &e) {
            log_->error("consensus persist failed symbol={} error={}", symbol, e.what());
        }
        cache_->publish(*rec);
        log_->info("consensus symbol={} price={} sources={} std_dev={}",
                   rec->symbol, rec->price, rec->num_sources, rec->std_dev.value_or("-"));
        published.push_back(std::move(*rec));
    }
    return published;
}

void ConsensusAggregator::start()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this] { loop(); });
    log_->info("aggregator started window_ms={} interval_ms={} minimum_sources={}",
               opts_.window.count(), opts_.interval.count(), opts_.minimum_sources);
}

void ConsensusAggregator::stop()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ConsensusAggregator::loop()
{
    auto next = std::chrono::steady_clock::now() + opts_.interval;
    std::unique_lock<std::mutex> lk(mtx_);
    while (running_) {
        if (cv_.wait_until(lk, next, [this] { return !running_; })) break;
        next += opts_.interval;
        lk.unlock();
        run_cycle(now_ts());
        lk.lock();
    }
}
