#include "collector/batch_forwarder.hpp"
#include "collector/backoff.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace
{
    constexpr const char *kBatchesMetric = "collector_batches_delivered_total";
    constexpr const char *kFailuresMetric = "collector_delivery_failures_total";
    constexpr const char *kLostMetric = "collector_feeds_lost_total";
}

BatchForwarder::BatchForwarder(std::shared_ptr<IIngestClient> client,
                               ForwarderOptions opts,
                               std::shared_ptr<spdlog::logger> log,
                               std::shared_ptr<MetricsRegistry> metrics)
    : client_(std::move(client)), opts_(std::move(opts)), log_(std::move(log)), metrics_(std::move(metrics))
{
    if (!client_) throw ConfigError("BatchForwarder needs an ingest client");
    if (opts_.batch_size == 0 || opts_.batch_size > kMaxBatchFeeds) {
        throw ConfigError("batch size must be in [1, " + std::to_string(kMaxBatchFeeds) + "]");
    }
    if (opts_.max_buffered < opts_.batch_size) opts_.max_buffered = opts_.batch_size;
    if (opts_.max_delivery_attempts == 0) opts_.max_delivery_attempts = 1;

    if (metrics_) {
        metrics_->add_counter(kBatchesMetric, "Batches acknowledged by the ingestion gateway");
        metrics_->add_counter(kFailuresMetric, "Batch delivery attempts that failed in transport");
        metrics_->add_counter(kLostMetric, "Price feeds lost before ingestion");
    }
}

void BatchForwarder::count(const char *name, MetricsRegistry::Labels labels, double by)
{
    if (!metrics_) return;
    labels.emplace(labels.begin(), "worker_id", opts_.worker_id);
    metrics_->inc(name, labels, by);
}

BatchForwarder::~BatchForwarder()
{
    stop();
}

void BatchForwarder::start()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_) return;
    running_ = true;
    stopping_ = false;
    worker_ = std::thread([this] { run(); });
}

void BatchForwarder::add(PriceFeed feed)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (buffer_.size() >= opts_.max_buffered) {
            buffer_.pop_front();
            ++stats_.feeds_evicted;
            count(kLostMetric, {{"reason", "evicted"}});
            if (stats_.feeds_evicted == 1 || stats_.feeds_evicted % 100 == 0) {
                log_->warn("buffer ceiling reached max_buffered={} evicted_total={}",
                           opts_.max_buffered, stats_.feeds_evicted);
            }
        }
        buffer_.push_back(Pending{next_seq_++, std::move(feed), std::chrono::steady_clock::now()});
    }
    cv_.notify_one();
}

void BatchForwarder::flush_now()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        flush_requested_ = true;
    }
    cv_.notify_one();
}

void BatchForwarder::stop()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = false;
}

ForwarderStats BatchForwarder::stats() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    ForwarderStats s = stats_;
    s.buffered = buffer_.size();
    return s;
}

bool BatchForwarder::flush_due(std::chrono::steady_clock::time_point now) const
{
    if (buffer_.empty()) return false;
    if (flush_requested_ || stopping_) return true;
    if (buffer_.size() >= opts_.batch_size) return true;
    return now - buffer_.front().arrived >= opts_.batch_interval;
}

void BatchForwarder::run()
{
    std::unique_lock<std::mutex> lk(mtx_);
    for (;;) {
        while (!flush_due(std::chrono::steady_clock::now())) {
            if (stopping_) {
                log_->info("forwarder stopped batches_sent={} feeds_dropped={} feeds_evicted={}",
                           stats_.batches_sent, stats_.feeds_dropped, stats_.feeds_evicted);
                return;
            }
            if (buffer_.empty()) {
                flush_requested_ = false;
                cv_.wait(lk);
            } else {
                cv_.wait_until(lk, buffer_.front().arrived + opts_.batch_interval);
            }
        }
        deliver_batch(lk);
    }
}

// Called with lk held; releases it around network calls.
void BatchForwarder::deliver_batch(std::unique_lock<std::mutex> &lk)
{
    flush_requested_ = false;

    IngestBatch batch;
    batch.worker_id = opts_.worker_id;
    const std::size_t n = std::min(opts_.batch_size, buffer_.size());
    batch.feeds.reserve(n);
    for (std::size_t i = 0; i < n; ++i) batch.feeds.push_back(buffer_[i].feed);
    const std::uint64_t last_seq = buffer_[n - 1].seq;

    bool acked = false;
    std::string error;
    unsigned attempt = 0;
    while (!acked) {
        ++attempt;
        batch.timestamp = now_ts();
        lk.unlock();
        try {
            IngestResult res = client_->deliver(batch);
            lk.lock();
            acked = true;
            ++stats_.batches_sent;
            stats_.feeds_ingested += res.ingested;
            stats_.feeds_rejected += res.failed;
            count(kBatchesMetric, {{"status", to_cstr(res.status)}});
            if (res.status == IngestStatus::Success) {
                log_->debug("batch delivered feeds={} latency_ms={}", n, res.latency_ms);
            } else {
                log_->warn("batch {} ingested={} failed={} message={}",
                           to_cstr(res.status), res.ingested, res.failed, res.message);
            }
        } catch (const DeliveryError &e) {
            lk.lock();
            error = e.what();
            ++stats_.delivery_failures;
            count(kFailuresMetric, {});
            stats_.last_error = error;
            if (attempt >= opts_.max_delivery_attempts || stopping_) break;
            const auto delay = backoff_delay(attempt, opts_.retry_base, opts_.retry_max);
            log_->warn("delivery failed attempt={} max_attempts={} retry_in_ms={} error={}",
                       attempt, opts_.max_delivery_attempts, delay.count(), error);
            cv_.wait_for(lk, delay, [this] { return stopping_; });
        }
    }

    // Entries may have been evicted meanwhile; drop whatever of this batch is left.
    while (!buffer_.empty() && buffer_.front().seq <= last_seq) buffer_.pop_front();

    if (!acked) {
        std::set<std::string> symbols;
        for (const auto &f : batch.feeds) symbols.insert(f.symbol);
        std::ostringstream os;
        bool first = true;
        for (const auto &s : symbols) {
            if (!first) os << ",";
            os << s;
            first = false;
        }
        ++stats_.batches_dropped;
        stats_.feeds_dropped += n;
        count(kLostMetric, {{"reason", "delivery"}}, static_cast<double>(n));
        log_->error("dropping batch feeds={} symbols={} attempts={} error={}",
                    n, os.str(), attempt, error);
    }
}
