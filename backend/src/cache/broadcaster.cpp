#include "cache/broadcaster.hpp"

#include <algorithm>

bool Subscription::try_pop(StreamEvent &out)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::optional<StreamEvent> Subscription::wait_pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    StreamEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

std::vector<StreamEvent> Subscription::drain()
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<StreamEvent> out(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

bool Subscription::closed() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

bool Subscription::overflowed() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return overflowed_;
}

void Subscription::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
        queue_.clear();
        queue_.shrink_to_fit();
    }
    cv_.notify_all();
}

bool Subscription::offer(const StreamEvent &ev)
{
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return false;
        if (queue_.size() >= capacity_) {
            closed_ = true;
            overflowed_ = true;
            queue_.clear();
        } else {
            queue_.push_back(ev);
            accepted = true;
        }
    }
    cv_.notify_all();
    return accepted;
}

PriceBroadcaster::PriceBroadcaster(std::size_t default_capacity, std::shared_ptr<spdlog::logger> log)
    : default_capacity_(default_capacity == 0 ? 1 : default_capacity), log_(std::move(log))
{
}

std::shared_ptr<Subscription> PriceBroadcaster::subscribe(std::size_t capacity)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto sub = std::make_shared<Subscription>(next_id_++, capacity == 0 ? default_capacity_ : capacity);
    subs_.push_back(sub);
    log_->debug("subscriber added id={} total={}", sub->id(), subs_.size());
    return sub;
}

void PriceBroadcaster::unsubscribe(std::uint64_t id)
{
    std::shared_ptr<Subscription> removed;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = std::find_if(subs_.begin(), subs_.end(),
                               [id](const auto &s) { return s->id() == id; });
        if (it == subs_.end()) return;
        removed = *it;
        subs_.erase(it);
    }
    removed->cancel();
}

void PriceBroadcaster::publish(const ConsensusRecord &rec)
{
    StreamEvent ev;
    ev.kind = StreamEvent::Kind::Consensus;
    ev.consensus = rec;
    publish(ev);
}

void PriceBroadcaster::publish(const PriceFeed &feed)
{
    StreamEvent ev;
    ev.kind = StreamEvent::Kind::PriceUpdate;
    ev.feed = feed;
    publish(ev);
}

void PriceBroadcaster::publish(const StreamEvent &ev)
{
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = subs_.begin(); it != subs_.end();) {
        auto &sub = *it;
        if (sub->closed()) {
            it = subs_.erase(it);
            continue;
        }
        if (!sub->offer(ev)) {
            if (!sub->overflowed()) { // cancelled concurrently
                it = subs_.erase(it);
                continue;
            }
            ++disconnected_slow_;
            log_->warn("disconnecting slow subscriber id={} symbol={}", sub->id(), ev.symbol());
            it = subs_.erase(it);
            continue;
        }
        ++it;
    }
}

std::size_t PriceBroadcaster::subscriber_count() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return subs_.size();
}

std::uint64_t PriceBroadcaster::disconnected_slow() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return disconnected_slow_;
}
