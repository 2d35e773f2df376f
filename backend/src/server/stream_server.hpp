#pragma once
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cache/broadcaster.hpp"
#include "util/metrics.hpp"

namespace uWS { struct Loop; }

// WebSocket fan-out of price updates and consensus records on /ws.
//
// Client -> server:
//   {"type":"subscribe","symbols":["BTC/USD",...]}    adds symbols
//   {"type":"unsubscribe","symbols":["BTC/USD",...]}  removes symbols
//   {"type":"ping"}
// Server -> client:
//   {"type":"price_update","data":{...}}  {"type":"consensus","data":{...}}
//   {"type":"subscribed","symbols":[...]} {"type":"unsubscribed","symbols":[...]}
//   {"type":"pong","timestamp":"..."}     {"type":"error","message":"..."}
//
// Nothing is streamed to a socket until it subscribes. Each socket owns one
// Subscription; a pump thread defers a drain onto the uWS loop so all socket
// access stays on the loop thread. A socket whose queue overflows is closed
// with 1008.
class StreamServer {
public:
    struct Options {
        int port{9001};                    // 0 picks a free port, see bound_port()
        std::size_t queue_capacity{256};
        std::chrono::milliseconds pump_interval{50};
        std::chrono::milliseconds heartbeat_interval{30000};
        std::size_t max_connections{10000};
        unsigned max_backpressure{1024 * 1024};
    };

    StreamServer(std::shared_ptr<PriceBroadcaster> broadcaster, Options opts,
                 std::shared_ptr<spdlog::logger> log,
                 std::shared_ptr<MetricsRegistry> metrics = nullptr);
    ~StreamServer();

    StreamServer(const StreamServer &) = delete;
    StreamServer &operator=(const StreamServer &) = delete;

    // Blocks in the uWS event loop until stop(). Throws when the port cannot be bound.
    void run();
    // Safe from any thread.
    void stop();

    // Listening port once run() has bound it, 0 before.
    int bound_port() const { return bound_port_.load(); }
    std::size_t connection_count() const { return connections_.load(); }

private:
    struct State;

    std::shared_ptr<PriceBroadcaster> broadcaster_;
    Options opts_;
    std::shared_ptr<spdlog::logger> log_;
    std::shared_ptr<MetricsRegistry> metrics_;

    std::mutex loop_mtx_;
    uWS::Loop* loop_{nullptr};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> bound_port_{0};
    std::atomic<std::size_t> connections_{0};
    std::unique_ptr<State> state_;
    std::thread pump_;
};
