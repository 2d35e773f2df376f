#pragma once
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "collector/ingest_client.hpp"
#include "md/price_feed.hpp"
#include "util/metrics.hpp"

struct ForwarderOptions {
    std::string worker_id;
    std::size_t batch_size{kMaxBatchFeeds};
    std::chrono::milliseconds batch_interval{5000};
    std::size_t max_buffered{10000};
    unsigned max_delivery_attempts{3};
    std::chrono::milliseconds retry_base{1000};
    std::chrono::milliseconds retry_max{60000};
};

struct ForwarderStats {
    std::size_t buffered{0};
    std::uint64_t batches_sent{0};
    std::uint64_t feeds_ingested{0};
    std::uint64_t feeds_rejected{0};   // acknowledged but failed validation/storage
    std::uint64_t delivery_failures{0};
    std::uint64_t batches_dropped{0};
    std::uint64_t feeds_dropped{0};
    std::uint64_t feeds_evicted{0};
    std::string last_error;
};

// Shared buffer between all connections of a collector and the ingest client.
// add() never waits on the network; a worker thread flushes on size or age.
// Every lost feed is logged and counted in stats() and, when given, `metrics`.
class BatchForwarder {
public:
    BatchForwarder(std::shared_ptr<IIngestClient> client,
                   ForwarderOptions opts,
                   std::shared_ptr<spdlog::logger> log,
                   std::shared_ptr<MetricsRegistry> metrics = nullptr);
    ~BatchForwarder();

    BatchForwarder(const BatchForwarder &) = delete;
    BatchForwarder &operator=(const BatchForwarder &) = delete;

    void start();
    void add(PriceFeed feed);
    void flush_now();
    // Drains the buffer (one delivery attempt per batch once stopping) and joins the worker.
    void stop();

    ForwarderStats stats() const;

private:
    struct Pending {
        std::uint64_t seq{0};
        PriceFeed feed;
        std::chrono::steady_clock::time_point arrived;
    };

    void run();
    bool flush_due(std::chrono::steady_clock::time_point now) const;
    void deliver_batch(std::unique_lock<std::mutex> &lk);
    void count(const char *name, MetricsRegistry::Labels labels, double by = 1);

    std::shared_ptr<IIngestClient> client_;
    ForwarderOptions opts_;
    std::shared_ptr<spdlog::logger> log_;
    std::shared_ptr<MetricsRegistry> metrics_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Pending> buffer_;
    std::uint64_t next_seq_{1};
    bool flush_requested_{false};
    bool stopping_{false};
    bool running_{false};
    ForwarderStats stats_;
    std::thread worker_;
};
