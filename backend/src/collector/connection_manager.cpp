#include "collector/connection_manager.hpp"
#include "util/errors.hpp"

#include <boost/asio/post.hpp>
#include <future>

namespace net = boost::asio;

ConnectionManager::ConnectionManager(std::unique_ptr<IExchangeAdapter> adapter,
                                     std::unique_ptr<IWsTransport> transport,
                                     FeedSink sink,
                                     ReconnectPolicy policy,
                                     std::shared_ptr<spdlog::logger> log)
    : adapter_(std::move(adapter)),
      transport_(std::move(transport)),
      sink_(std::move(sink)),
      policy_(policy),
      log_(std::move(log)),
      work_(net::make_work_guard(ioc_)),
      reconnect_timer_(ioc_)
{
    if (!adapter_ || !transport_) {
        throw ConfigError("ConnectionManager needs an adapter and a transport");
    }
    io_thread_ = std::thread([this] { ioc_.run(); });
}

ConnectionManager::~ConnectionManager()
{
    disconnect();
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

void ConnectionManager::connect()
{
    net::post(ioc_, [this] {
        stopped_.store(false, std::memory_order_release);
        do_connect();
    });
}

void ConnectionManager::restart()
{
    net::post(ioc_, [this] {
        stopped_.store(false, std::memory_order_release);
        reconnect_timer_.cancel();
        reconnect_pending_.store(false);
        attempts_.store(0);
        log_->info("operator restart");
        do_connect();
    });
}

void ConnectionManager::disconnect()
{
    if (!io_thread_.joinable()) return;

    stopped_.store(true, std::memory_order_release);
    transport_->close(); // unblocks a reader or an in-flight handshake

    if (std::this_thread::get_id() == io_thread_.get_id()) {
        teardown();
        return;
    }
    std::promise<void> done;
    auto fut = done.get_future();
    net::post(ioc_, [this, &done] {
        teardown();
        done.set_value();
    });
    fut.wait();
}

void ConnectionManager::teardown()
{
    stopped_.store(true, std::memory_order_release);
    reconnect_timer_.cancel();
    reconnect_pending_.store(false);
    ++session_;
    transport_->close();
    join_reader();
    set_state(ConnectionState::Disconnected);
}

void ConnectionManager::do_connect()
{
    if (stopped_.load(std::memory_order_acquire)) return;
    const auto current = state();
    if (current == ConnectionState::Connecting || current == ConnectionState::Connected) return;

    join_reader();
    set_state(ConnectionState::Connecting);

    const WsEndpoint ep = adapter_->endpoint();
    try {
        transport_->open(ep);
    } catch (const TransportError &e) {
        set_last_error(e.what());
        log_->warn("connect failed host={} error={}", ep.host, e.what());
        transport_->close();
        if (stopped_.load(std::memory_order_acquire)) {
            set_state(ConnectionState::Disconnected);
            return;
        }
        set_state(ConnectionState::Failed);
        schedule_reconnect();
        return;
    }

    if (stopped_.load(std::memory_order_acquire)) {
        transport_->close();
        set_state(ConnectionState::Disconnected);
        return;
    }

    set_state(ConnectionState::Connected);
    attempts_.store(0);
    ++connects_;
    {
        std::lock_guard<std::mutex> lk(info_mtx_);
        connected_at_ = std::chrono::steady_clock::now();
    }

    const std::string sub = adapter_->build_subscription();
    if (!sub.empty()) {
        try {
            transport_->write(sub);
            log_->info("subscribed symbols={}", adapter_->symbols().size());
        } catch (const TransportError &e) {
            set_last_error(e.what());
            log_->warn("subscribe failed error={}", e.what());
            transport_->close();
            set_state(ConnectionState::Failed);
            schedule_reconnect();
            return;
        }
    }

    const std::uint64_t session = ++session_;
    reader_ = std::thread([this, session] { reader_loop(session); });
}

void ConnectionManager::schedule_reconnect()
{
    if (stopped_.load(std::memory_order_acquire)) return;
    if (reconnect_pending_.load()) return; // close after error, one retry is enough

    const unsigned done = attempts_.load();
    if (done >= policy_.max_attempts) {
        set_state(ConnectionState::Failed);
        log_->error("max reconnect attempts reached attempts={} max_attempts={}; giving up",
                    done, policy_.max_attempts);
        return;
    }

    const unsigned attempt = done + 1;
    attempts_.store(attempt);
    const auto delay = policy_.delay_for(attempt);
    reconnect_pending_.store(true);
    log_->info("scheduling reconnect attempt={} max_attempts={} delay_ms={}",
               attempt, policy_.max_attempts, delay.count());

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([this](const boost::system::error_code &ec) {
        if (ec) return; // cancelled
        reconnect_pending_.store(false);
        if (stopped_.load(std::memory_order_acquire)) return;
        do_connect();
    });
}

void ConnectionManager::handle_close(std::uint64_t session)
{
    if (session != session_) return;
    join_reader();
    if (stopped_.load(std::memory_order_acquire)) {
        set_state(ConnectionState::Disconnected);
        return;
    }
    set_last_error("connection closed by peer");
    set_state(ConnectionState::Reconnecting);
    schedule_reconnect();
}

void ConnectionManager::handle_error(std::uint64_t session, const std::string &what)
{
    if (session != session_) return;
    join_reader();
    set_last_error(what);
    log_->warn("transport error: {}", what);
    transport_->close();
    if (stopped_.load(std::memory_order_acquire)) {
        set_state(ConnectionState::Disconnected);
        return;
    }
    set_state(ConnectionState::Failed);
    schedule_reconnect();
}

void ConnectionManager::reader_loop(std::uint64_t session)
{
    std::string raw;
    try {
        while (transport_->read(raw)) {
            on_message(raw);
        }
        net::post(ioc_, [this, session] { handle_close(session); });
    } catch (const TransportError &e) {
        net::post(ioc_, [this, session, what = std::string(e.what())] {
            handle_error(session, what);
        });
    }
}

void ConnectionManager::on_message(const std::string &raw)
{
    ++messages_;
    try {
        auto feed = adapter_->parse_message(raw);
        if (!feed) return;
        ++feeds_;
        log_->debug("feed symbol={} price={}", feed->symbol, feed->price);
        sink_(std::move(*feed));
    } catch (const ParseError &e) {
        ++parse_errors_;
        log_->warn("parse error: {}", e.what());
    }
}

void ConnectionManager::set_state(ConnectionState next)
{
    const auto prev = state_.exchange(next, std::memory_order_acq_rel);
    if (prev != next) {
        log_->info("state change from={} to={}", to_cstr(prev), to_cstr(next));
    }
}

void ConnectionManager::set_last_error(const std::string &what)
{
    std::lock_guard<std::mutex> lk(info_mtx_);
    last_error_ = what;
}

void ConnectionManager::join_reader()
{
    if (reader_.joinable()) reader_.join();
}

ConnectionStatus ConnectionManager::status() const
{
    ConnectionStatus s;
    s.exchange = adapter_->name();
    s.state = state();
    s.reconnect_attempts = attempts_.load();
    s.max_attempts = policy_.max_attempts;
    s.reconnect_pending = reconnect_pending_.load();
    s.connects = connects_.load();
    s.messages = messages_.load();
    s.feeds = feeds_.load();
    s.parse_errors = parse_errors_.load();
    std::lock_guard<std::mutex> lk(info_mtx_);
    s.last_error = last_error_;
    if (s.state == ConnectionState::Connected) {
        s.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - connected_at_).count();
    }
    return s;
}
