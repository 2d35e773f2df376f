#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "cache/price_cache.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "ingest/wire_codec.hpp"
#include "md/symbol_codec.hpp"
#include "storage/feed_store.hpp"
#include "storage/ohlcv.hpp"
#include "util/env_config.hpp"
#include "util/errors.hpp"
#include "util/metrics.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

struct RouteContext {
    const IngestionGateway& gateway;
    const PublishedPriceCache& cache;
    const IFeedStore& store;
    const MetricsRegistry* metrics{nullptr}; // GET /metrics is 404 without one
};

// Caps for read endpoints.
inline constexpr std::size_t kMaxQuerySymbols = 50;
inline constexpr std::chrono::hours kMaxOhlcvRange{24 * 7};

namespace detail {

inline void reply_json(http::response<http::string_body>& res, http::status status, const nlohmann::json& body)
{
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
}

inline void reply_metrics(http::response<http::string_body>& res, const MetricsRegistry& metrics)
{
    res.result(http::status::ok);
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = metrics.to_prometheus();
}

inline void reply_error(http::response<http::string_body>& res, http::status status, const std::string& message)
{
    reply_json(res, status, {{"error", message}});
}

inline std::string query_param(const urls::url_view& url, std::string_view key)
{
    for (auto const& p : url.params()) {
        if (p.key == key) return std::string(p.value);
    }
    return {};
}

// Comma separated symbol list; empty vector when absent or any entry is malformed.
inline std::vector<std::string> symbol_list(const urls::url_view& url, std::string& error)
{
    std::vector<std::string> symbols = split_list(query_param(url, "symbols"));
    if (symbols.empty()) {
        error = "symbols query parameter is required (e.g. symbols=BTC/USD,ETH/USD)";
        return {};
    }
    if (symbols.size() > kMaxQuerySymbols) {
        error = "at most " + std::to_string(kMaxQuerySymbols) + " symbols per request";
        return {};
    }
    for (const auto& s : symbols) {
        if (!SymbolCodec::is_canonical(s)) {
            error = "symbol '" + s + "' must be in format BASE/QUOTE";
            return {};
        }
    }
    return symbols;
}

inline void handle_ingest(const RouteContext& ctx,
                          const http::request<http::string_body>& req,
                          http::response<http::string_body>& res)
{
    IngestBatch batch;
    try {
        batch = decode_batch(req.body());
    } catch (const WireFormatError& e) {
        IngestResult bad;
        bad.status = IngestStatus::Error;
        bad.message = e.what();
        reply_json(res, http::status::bad_request, result_to_json(bad));
        return;
    }

    IngestResult result = ctx.gateway.ingest(batch);
    const auto status = result.status == IngestStatus::Error ? http::status::bad_request : http::status::ok;
    reply_json(res, status, result_to_json(result));
}

inline void handle_latest(const RouteContext& ctx, const urls::url_view& url,
                          http::response<http::string_body>& res)
{
    std::string error;
    auto symbols = symbol_list(url, error);
    if (symbols.empty()) return reply_error(res, http::status::bad_request, error);

    const Timestamp now = now_ts();
    nlohmann::json data = nlohmann::json::array();
    for (const auto& symbol : symbols) {
        nlohmann::json feeds = nlohmann::json::array();
        for (const auto& cached : ctx.cache.latest_feeds(symbol, now)) {
            nlohmann::json f = feed_to_json(cached.feed);
            f["staleness_ms"] = cached.staleness_ms;
            feeds.push_back(std::move(f));
        }
        if (feeds.empty()) {
            if (auto stored = ctx.store.latest_feed(symbol)) {
                nlohmann::json f = feed_to_json(*stored);
                f["staleness_ms"] = (now - stored->timestamp).count();
                feeds.push_back(std::move(f));
            }
        }
        data.push_back({{"symbol", symbol}, {"feeds", std::move(feeds)}});
    }
    reply_json(res, http::status::ok, {{"data", std::move(data)}, {"timestamp", format_iso8601(now)}});
}

inline void handle_consensus(const RouteContext& ctx, const urls::url_view& url,
                             http::response<http::string_body>& res)
{
    std::string error;
    auto symbols = symbol_list(url, error);
    if (symbols.empty()) return reply_error(res, http::status::bad_request, error);

    const Timestamp now = now_ts();
    nlohmann::json data = nlohmann::json::array();
    nlohmann::json missing = nlohmann::json::array();
    for (const auto& symbol : symbols) {
        std::optional<ConsensusRecord> rec;
        if (auto cached = ctx.cache.consensus(symbol, now)) {
            rec = cached->record;
        } else {
            rec = ctx.store.latest_consensus(symbol);
        }
        if (!rec) {
            missing.push_back(symbol);
            continue;
        }
        nlohmann::json j = consensus_to_json(*rec);
        j["staleness_ms"] = (now - rec->timestamp).count();
        data.push_back(std::move(j));
    }
    reply_json(res, http::status::ok, {
        {"data", std::move(data)},
        {"missing", std::move(missing)},
        {"timestamp", format_iso8601(now)},
    });
}

inline void handle_ohlcv(const RouteContext& ctx, const urls::url_view& url,
                         http::response<http::string_body>& res)
{
    const std::string symbol = query_param(url, "symbol");
    if (!SymbolCodec::is_canonical(symbol)) {
        return reply_error(res, http::status::bad_request, "symbol must be in format BASE/QUOTE");
    }
    std::string interval_s = query_param(url, "interval");
    if (interval_s.empty()) interval_s = "1m";
    auto interval = parse_bar_interval(interval_s);
    if (!interval) {
        return reply_error(res, http::status::bad_request, "interval must be one of: 1m, 5m, 15m, 1h, 4h, 1d");
    }

    const Timestamp now = now_ts();
    Timestamp to = now;
    Timestamp from = now - std::chrono::hours(1);
    if (auto raw = query_param(url, "to"); !raw.empty()) {
        auto t = parse_iso8601(raw);
        if (!t) return reply_error(res, http::status::bad_request, "to must be ISO 8601");
        to = *t;
    }
    if (auto raw = query_param(url, "from"); !raw.empty()) {
        auto t = parse_iso8601(raw);
        if (!t) return reply_error(res, http::status::bad_request, "from must be ISO 8601");
        from = *t;
    }
    if (from > to) return reply_error(res, http::status::bad_request, "from must not be after to");
    if (to - from > kMaxOhlcvRange) return reply_error(res, http::status::bad_request, "range exceeds 7 days");

    nlohmann::json bars = nlohmann::json::array();
    for (const auto& bar : build_ohlcv(ctx.store.feeds_between(symbol, from, to), *interval)) {
        bars.push_back({
            {"timestamp", format_iso8601(bar.bucket_start)},
            {"open", bar.open},
            {"high", bar.high},
            {"low", bar.low},
            {"close", bar.close},
            {"volume", bar.volume},
            {"num_feeds", bar.num_feeds},
        });
    }
    reply_json(res, http::status::ok, {
        {"symbol", symbol},
        {"interval", interval_s},
        {"from", format_iso8601(from)},
        {"to", format_iso8601(to)},
        {"data", std::move(bars)},
    });
}

} // namespace detail

inline void handle_request(const RouteContext& ctx,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "pricefuse/1.0");

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        return detail::reply_error(res, http::status::bad_request, "bad request");
    }
    urls::url_view url = *parsed_result;
    const std::string path(url.path());

    try {
        if (req.method() == http::verb::get && path == "/api/health") {
            return detail::reply_json(res, http::status::ok, {
                {"status", "ok"},
                {"store", ctx.store.kind()},
                {"timestamp", format_iso8601(now_ts())},
            });
        }
        if (req.method() == http::verb::get && path == "/metrics" && ctx.metrics) {
            return detail::reply_metrics(res, *ctx.metrics);
        }
        if (path == "/internal/ingest") {
            if (req.method() != http::verb::post) {
                return detail::reply_error(res, http::status::method_not_allowed, "use POST");
            }
            return detail::handle_ingest(ctx, req, res);
        }
        if (req.method() == http::verb::get && path == "/v1/prices/latest") {
            return detail::handle_latest(ctx, url, res);
        }
        if (req.method() == http::verb::get && path == "/v1/prices/ohlcv") {
            return detail::handle_ohlcv(ctx, url, res);
        }
        if (req.method() == http::verb::get && path == "/v1/consensus") {
            return detail::handle_consensus(ctx, url, res);
        }
    } catch (const StorageError& e) {
        return detail::reply_error(res, http::status::service_unavailable, e.what());
    }

    // 404
    detail::reply_error(res, http::status::not_found, "not found");
}
