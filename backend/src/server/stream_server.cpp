#include "server/stream_server.hpp"
#include "ingest/wire_codec.hpp"
#include "md/symbol_codec.hpp"
#include "util/time_format.hpp"

#include <uwebsockets/App.h>
#include <nlohmann/json.hpp>
#include <set>
#include <string_view>
#include <vector>

using json = nlohmann::json;

struct StreamUserData {
    std::shared_ptr<Subscription> sub;
    std::set<std::string> symbols;
};

using StreamSocket = uWS::WebSocket<false, true, StreamUserData>;

// Loop-thread-only state.
struct StreamServer::State {
    std::set<StreamSocket*> sockets;
    us_listen_socket_t* listen_socket{nullptr};
};

namespace
{
    constexpr const char *kConnectionsMetric = "websocket_connections_active";
    constexpr const char *kSentMetric = "websocket_messages_sent_total";

    std::string event_frame(const StreamEvent& ev)
    {
        if (ev.kind == StreamEvent::Kind::Consensus) {
            return json{{"type", "consensus"}, {"data", consensus_to_json(ev.consensus)}}.dump();
        }
        json data = feed_to_json(ev.feed);
        if (!ev.feed.volume) data["volume"] = nullptr;
        return json{{"type", "price_update"}, {"data", std::move(data)}}.dump();
    }

    const char* event_type(const StreamEvent& ev)
    {
        return ev.kind == StreamEvent::Kind::Consensus ? "consensus" : "price_update";
    }

    std::string error_frame(const std::string& message)
    {
        return json{{"type", "error"}, {"message", message}}.dump();
    }

    std::string pong_frame()
    {
        return json{{"type", "pong"}, {"timestamp", format_iso8601(now_ts())}}.dump();
    }

    std::vector<std::string> string_items(const json& j, const char* key)
    {
        std::vector<std::string> out;
        auto it = j.find(key);
        if (it == j.end() || !it->is_array()) return out;
        for (const auto& s : *it) {
            if (s.is_string()) out.push_back(s.get<std::string>());
        }
        return out;
    }

    // Applies one client message to `symbols`; returns the reply frame and its type.
    std::pair<std::string, const char*> handle_client_message(std::set<std::string>& symbols,
                                                              std::string_view msg)
    {
        json j = json::parse(msg, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            return {error_frame("Invalid message format"), "error"};
        }
        const std::string type = j["type"].get<std::string>();
        if (type == "subscribe") {
            std::vector<std::string> added;
            for (auto& s : string_items(j, "symbols")) {
                if (!SymbolCodec::is_canonical(s)) continue;
                symbols.insert(s);
                added.push_back(std::move(s));
            }
            if (added.empty()) {
                return {error_frame("No valid symbols provided. Format: BTC/USD, ETH/USD, etc."), "error"};
            }
            return {json{{"type", "subscribed"}, {"symbols", added}}.dump(), "subscribed"};
        }
        if (type == "unsubscribe") {
            const auto removed = string_items(j, "symbols");
            for (const auto& s : removed) symbols.erase(s);
            return {json{{"type", "unsubscribed"}, {"symbols", removed}}.dump(), "unsubscribed"};
        }
        if (type == "ping") return {pong_frame(), "pong"};
        return {error_frame("Unknown message type: " + type), "error"};
    }
}

StreamServer::StreamServer(std::shared_ptr<PriceBroadcaster> broadcaster, Options opts,
                           std::shared_ptr<spdlog::logger> log,
                           std::shared_ptr<MetricsRegistry> metrics)
    : broadcaster_(std::move(broadcaster)), opts_(opts), log_(std::move(log)),
      metrics_(std::move(metrics)), state_(std::make_unique<State>())
{
    if (metrics_) {
        metrics_->add_gauge(kConnectionsMetric, "Number of active WebSocket connections");
        metrics_->add_counter(kSentMetric, "Total number of WebSocket messages sent");
        metrics_->set(kConnectionsMetric, {}, 0);
    }
}

StreamServer::~StreamServer()
{
    stop();
    if (pump_.joinable()) pump_.join();
}

void StreamServer::run()
{
    uWS::App app;
    State* state = state_.get();
    auto broadcaster = broadcaster_;
    auto log = log_;
    auto metrics = metrics_;
    auto* connections = &connections_;
    const std::size_t capacity = opts_.queue_capacity;
    const std::size_t max_connections = opts_.max_connections;

    auto sent = [metrics](const char* type) {
        if (metrics) metrics->inc(kSentMetric, {{"type", type}});
    };

    app.ws<StreamUserData>("/ws",
        {
            .compression = uWS::SHARED_COMPRESSOR,
            .maxPayloadLength = 16 * 1024,
            .idleTimeout = 120,
            .maxBackpressure = opts_.max_backpressure,
            .closeOnBackpressureLimit = true,
            .open = [state, broadcaster, log, metrics, connections, capacity, max_connections](auto* ws) {
                if (state->sockets.size() >= max_connections) {
                    log->warn("rejecting client, connection limit {} reached", max_connections);
                    ws->end(1008, "Connection limit reached");
                    return;
                }
                auto* data = ws->getUserData();
                data->sub = broadcaster->subscribe(capacity);
                state->sockets.insert(ws);
                connections->store(state->sockets.size());
                if (metrics) metrics->inc(kConnectionsMetric);
                log->info("client connected id={} clients={}", data->sub->id(), state->sockets.size());
            },
            .message = [log, sent](auto* ws, std::string_view msg, uWS::OpCode) {
                auto* data = ws->getUserData();
                auto [reply, type] = handle_client_message(data->symbols, msg);
                if (data->sub) {
                    log->debug("client message id={} reply={} symbols={}", data->sub->id(), type, data->symbols.size());
                }
                ws->send(reply, uWS::OpCode::TEXT);
                sent(type);
            },
            .close = [state, broadcaster, log, metrics, connections](auto* ws, int code, std::string_view) {
                auto* data = ws->getUserData();
                state->sockets.erase(ws);
                connections->store(state->sockets.size());
                if (data->sub) {
                    broadcaster->unsubscribe(data->sub->id());
                    if (metrics) metrics->dec(kConnectionsMetric);
                    log->info("client disconnected id={} code={} clients={}",
                              data->sub->id(), code, state->sockets.size());
                    data->sub.reset();
                }
            }
        }
    );

    app.listen(opts_.port, [this, state](us_listen_socket_t* token) {
        state->listen_socket = token;
        if (!token) {
            log_->error("stream failed to listen on port {}", opts_.port);
            return;
        }
        bound_port_.store(us_socket_local_port(0, reinterpret_cast<us_socket_t*>(token)));
        log_->info("stream listening on ws://0.0.0.0:{}/ws", bound_port_.load());
    });
    if (!state->listen_socket) {
        throw std::runtime_error("stream server could not listen on port " + std::to_string(opts_.port));
    }

    {
        std::lock_guard<std::mutex> lk(loop_mtx_);
        loop_ = uWS::Loop::get();
    }
    running_.store(true);

    // Pump: move queued events onto the sockets from the loop thread.
    uWS::Loop* loop = loop_;
    pump_ = std::thread([this, loop, state, sent] {
        auto next_heartbeat = std::chrono::steady_clock::now() + opts_.heartbeat_interval;
        while (running_.load()) {
            std::this_thread::sleep_for(opts_.pump_interval);
            if (!running_.load()) break;
            bool heartbeat = false;
            if (std::chrono::steady_clock::now() >= next_heartbeat) {
                heartbeat = true;
                next_heartbeat += opts_.heartbeat_interval;
            }
            loop->defer([state, log = log_, sent, heartbeat] {
                std::vector<StreamSocket*> slow;
                for (auto* ws : state->sockets) {
                    auto* data = ws->getUserData();
                    if (!data->sub) continue;
                    if (data->sub->closed()) {
                        slow.push_back(ws);
                        continue;
                    }
                    for (const auto& ev : data->sub->drain()) {
                        if (!data->symbols.count(ev.symbol())) continue;
                        ws->send(event_frame(ev), uWS::OpCode::TEXT);
                        sent(event_type(ev));
                    }
                    if (heartbeat) {
                        ws->send(pong_frame(), uWS::OpCode::TEXT);
                        sent("pong");
                    }
                }
                // end() fires close, which edits the socket set
                for (auto* ws : slow) {
                    log->warn("closing slow client id={}", ws->getUserData()->sub->id());
                    ws->end(1008, "slow consumer");
                }
            });
        }
    });

    if (stop_requested_.load()) stop();

    app.run();

    running_.store(false);
    if (pump_.joinable()) pump_.join();
    {
        std::lock_guard<std::mutex> lk(loop_mtx_);
        loop_ = nullptr;
    }
    bound_port_.store(0);
    log_->info("stream server stopped");
}

void StreamServer::stop()
{
    stop_requested_.store(true);
    std::lock_guard<std::mutex> lk(loop_mtx_);
    if (!loop_) return;
    running_.store(false);
    State* state = state_.get();
    loop_->defer([state] {
        if (state->listen_socket) {
            us_listen_socket_close(0, state->listen_socket);
            state->listen_socket = nullptr;
        }
        std::vector<StreamSocket*> open(state->sockets.begin(), state->sockets.end());
        for (auto* ws : open) ws->end(1001, "server shutdown");
    });
}
