#pragma once
#include <chrono>
#include <functional>
#include <thread>

#include "md/price_feed.hpp"

// Polls `pred` until it holds or `timeout` passes.
inline bool wait_until(const std::function<bool()> &pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline PriceFeed make_test_feed(const std::string &symbol, const std::string &price,
                                const std::string &source, Timestamp ts,
                                const std::string &worker_id = "worker-test-1")
{
    PriceFeed f;
    f.symbol = symbol;
    f.price = price;
    f.source = source;
    f.timestamp = ts;
    f.worker_id = worker_id;
    return f;
}
