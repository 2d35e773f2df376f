#pragma once
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "collector/batch_forwarder.hpp"
#include "collector/connection_manager.hpp"
#include "util/metrics.hpp"

namespace http = boost::beast::http;

struct CollectorView {
    std::string worker_id;
    const std::vector<std::unique_ptr<ConnectionManager>>& connections;
    const BatchForwarder& forwarder;
    const MetricsRegistry* metrics{nullptr};
};

inline nlohmann::json connection_to_json(const ConnectionStatus& s) {
    nlohmann::json j = {
        {"exchange", s.exchange},
        {"state", to_cstr(s.state)},
        {"reconnect_attempts", s.reconnect_attempts},
        {"max_attempts", s.max_attempts},
        {"reconnect_pending", s.reconnect_pending},
        {"connects", s.connects},
        {"messages", s.messages},
        {"feeds", s.feeds},
        {"parse_errors", s.parse_errors},
        {"uptime_ms", s.uptime_ms},
    };
    j["last_error"] = s.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(s.last_error);
    return j;
}

inline nlohmann::json forwarder_to_json(const ForwarderStats& s) {
    nlohmann::json j = {
        {"buffered", s.buffered},
        {"batches_sent", s.batches_sent},
        {"feeds_ingested", s.feeds_ingested},
        {"feeds_rejected", s.feeds_rejected},
        {"delivery_failures", s.delivery_failures},
        {"batches_dropped", s.batches_dropped},
        {"feeds_dropped", s.feeds_dropped},
        {"feeds_evicted", s.feeds_evicted},
    };
    j["last_error"] = s.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(s.last_error);
    return j;
}

inline nlohmann::json collector_status_json(const CollectorView& view) {
    nlohmann::json conns = nlohmann::json::array();
    for (const auto& c : view.connections) {
        conns.push_back(connection_to_json(c->status()));
    }
    return {
        {"worker_id", view.worker_id},
        {"connections", conns},
        {"forwarder", forwarder_to_json(view.forwarder.stats())},
    };
}

// Healthy while at least one connection is up or on its way back.
inline bool collector_healthy(const CollectorView& view) {
    for (const auto& c : view.connections) {
        const auto st = c->state();
        if (st == ConnectionState::Connected || st == ConnectionState::Connecting ||
            st == ConnectionState::Reconnecting) {
            return true;
        }
    }
    return false;
}

inline void handle_status_request(const CollectorView& view,
                                  const http::request<http::string_body>& req,
                                  http::response<http::string_body>& res) {
    const std::string target(req.target());
    const std::string path = target.substr(0, target.find('?'));
    res.set(http::field::content_type, "application/json");

    if (path == "/status" && req.method() == http::verb::get) {
        res.result(http::status::ok);
        res.body() = collector_status_json(view).dump();
        return;
    }

    if (path == "/metrics" && req.method() == http::verb::get && view.metrics) {
        res.result(http::status::ok);
        res.set(http::field::content_type, "text/plain; version=0.0.4");
        res.body() = view.metrics->to_prometheus();
        return;
    }

    if (path == "/health" && req.method() == http::verb::get) {
        const bool ok = collector_healthy(view);
        res.result(ok ? http::status::ok : http::status::service_unavailable);
        res.body() = nlohmann::json{{"status", ok ? "ok" : "degraded"},
                                    {"worker_id", view.worker_id}}.dump();
        return;
    }

    if (path == "/reconnect" && req.method() == http::verb::post) {
        nlohmann::json restarted = nlohmann::json::array();
        for (const auto& c : view.connections) {
            if (c->state() == ConnectionState::Failed) {
                c->restart();
                restarted.push_back(c->exchange());
            }
        }
        res.result(http::status::ok);
        res.body() = nlohmann::json{{"restarted", restarted}}.dump();
        return;
    }

    res.result(http::status::not_found);
    res.body() = R"({"error":"Not found"})";
}
