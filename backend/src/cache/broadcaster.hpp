#pragma once
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "md/price_feed.hpp"

class PriceBroadcaster;

// One item on the live stream: a published consensus record, or the newest
// accepted raw feed of a symbol from one ingest batch.
struct StreamEvent {
    enum class Kind { Consensus, PriceUpdate };

    Kind kind{Kind::Consensus};
    ConsensusRecord consensus; // Kind::Consensus
    PriceFeed feed;            // Kind::PriceUpdate

    const std::string &symbol() const { return kind == Kind::Consensus ? consensus.symbol : feed.symbol; }
};

// One live consumer's bounded queue. Closed when the consumer cancels or when
// the broadcaster finds the queue full; a closed subscription never reopens.
class Subscription {
public:
    Subscription(std::uint64_t id, std::size_t capacity) : id_(id), capacity_(capacity) {}

    std::uint64_t id() const { return id_; }

    bool try_pop(StreamEvent &out);
    std::optional<StreamEvent> wait_pop(std::chrono::milliseconds timeout);
    // Everything queued right now, in publish order.
    std::vector<StreamEvent> drain();

    bool closed() const;
    // True when the subscription was closed for falling behind.
    bool overflowed() const;
    // Releases the queue; the broadcaster drops the subscription on its next publish.
    void cancel();

private:
    friend class PriceBroadcaster;
    // False (and the subscription closes) when the queue is full.
    bool offer(const StreamEvent &ev);

    const std::uint64_t id_;
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<StreamEvent> queue_;
    bool closed_{false};
    bool overflowed_{false};
};

// Fan-out of stream events. publish() never blocks on a consumer.
class PriceBroadcaster {
public:
    PriceBroadcaster(std::size_t default_capacity, std::shared_ptr<spdlog::logger> log);

    std::shared_ptr<Subscription> subscribe(std::size_t capacity = 0);
    void unsubscribe(std::uint64_t id);
    void publish(const ConsensusRecord &rec);
    void publish(const PriceFeed &feed);
    void publish(const StreamEvent &ev);

    std::size_t subscriber_count() const;
    std::uint64_t disconnected_slow() const;

private:
    const std::size_t default_capacity_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<Subscription>> subs_;
    std::uint64_t next_id_{1};
    std::uint64_t disconnected_slow_{0};
};
