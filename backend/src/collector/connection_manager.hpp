#pragma once
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "collector/backoff.hpp"
#include "md/price_feed.hpp"
#include "venues/exchange_adapter.hpp"
#include "ws/ws.hpp"

struct ConnectionStatus {
    std::string exchange;
    ConnectionState state{ConnectionState::Disconnected};
    unsigned reconnect_attempts{0};   // consecutive, reset on successful connect
    unsigned max_attempts{0};
    bool reconnect_pending{false};
    std::uint64_t connects{0};
    std::uint64_t messages{0};
    std::uint64_t feeds{0};
    std::uint64_t parse_errors{0};
    std::int64_t uptime_ms{0};        // 0 unless connected
    std::string last_error;
};

// Owns one exchange connection and its reconnect state machine.
//
// All state transitions run on the manager's io thread. A reader thread per
// session blocks in transport->read(), hands feeds to the sink and reports
// close/error back to the io thread tagged with its session number, so events
// from a torn-down session are ignored.
class ConnectionManager {
public:
    using FeedSink = std::function<void(PriceFeed)>;

    ConnectionManager(std::unique_ptr<IExchangeAdapter> adapter,
                      std::unique_ptr<IWsTransport> transport,
                      FeedSink sink,
                      ReconnectPolicy policy,
                      std::shared_ptr<spdlog::logger> log);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Non-blocking; no-op while connecting or connected.
    void connect();
    // Operator restart after the attempt budget is exhausted.
    void restart();
    // Cancels the pending retry, closes the transport, forces disconnected.
    // Blocks until teardown is complete. Idempotent.
    void disconnect();

    ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    ConnectionStatus status() const;
    const std::string &exchange() const { return adapter_->name(); }

private:
    void do_connect();
    void schedule_reconnect();
    void handle_close(std::uint64_t session);
    void handle_error(std::uint64_t session, const std::string &what);
    void teardown();
    void set_state(ConnectionState next);
    void set_last_error(const std::string &what);
    void join_reader();

    void reader_loop(std::uint64_t session);
    void on_message(const std::string &raw);

    std::unique_ptr<IExchangeAdapter> adapter_;
    std::unique_ptr<IWsTransport> transport_;
    FeedSink sink_;
    ReconnectPolicy policy_;
    std::shared_ptr<spdlog::logger> log_;

    boost::asio::io_context ioc_{1};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::steady_timer reconnect_timer_;
    std::thread io_thread_;
    std::thread reader_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> reconnect_pending_{false};
    std::atomic<unsigned> attempts_{0};
    std::uint64_t session_{0}; // io thread only

    std::atomic<std::uint64_t> connects_{0};
    std::atomic<std::uint64_t> messages_{0};
    std::atomic<std::uint64_t> feeds_{0};
    std::atomic<std::uint64_t> parse_errors_{0};

    mutable std::mutex info_mtx_;
    std::string last_error_;
    std::chrono::steady_clock::time_point connected_at_{};
};
