#include "collector/collector_config.hpp"
#include "md/symbol_codec.hpp"
#include "util/env_config.hpp"
#include "util/errors.hpp"
#include "venues/venue_registry.hpp"

#include <set>

std::string exchange_from_worker_id(const std::string &worker_id)
{
    static const std::string prefix = "worker-";
    if (worker_id.rfind(prefix, 0) != 0) return {};
    const auto start = prefix.size();
    const auto dash = worker_id.find('-', start);
    if (dash == std::string::npos || dash == start || dash + 1 == worker_id.size()) return {};
    return worker_id.substr(start, dash - start);
}

CollectorConfig CollectorConfig::from_env()
{
    CollectorConfig cfg;
    cfg.worker_id = env_required("WORKER_ID");
    cfg.api_base_url = env_required("API_BASE_URL");

    cfg.exchanges = env_list("EXCHANGES");
    if (cfg.exchanges.empty()) {
        const std::string inferred = exchange_from_worker_id(cfg.worker_id);
        if (inferred.empty()) {
            throw ConfigError("EXCHANGES not set and WORKER_ID '" + cfg.worker_id +
                              "' is not of the form worker-<exchange>-<region>");
        }
        cfg.exchanges.push_back(inferred);
    }
    cfg.symbols = env_list("SYMBOLS", cfg.symbols);

    cfg.reconnect.max_attempts = static_cast<unsigned>(env_int("MAX_RECONNECT_ATTEMPTS", 10, 1, 1000));
    cfg.reconnect.base_delay = std::chrono::milliseconds(env_int("RECONNECT_BASE_MS", 1000, 1, 3600000));
    cfg.reconnect.max_delay = std::chrono::milliseconds(env_int("RECONNECT_MAX_MS", 60000, 1, 3600000));

    cfg.forwarder.worker_id = cfg.worker_id;
    cfg.forwarder.batch_size = static_cast<std::size_t>(env_int("BATCH_SIZE", 100, 1, kMaxBatchFeeds));
    cfg.forwarder.batch_interval = std::chrono::milliseconds(env_int("BATCH_INTERVAL_MS", 5000, 10, 3600000));
    cfg.forwarder.max_buffered = static_cast<std::size_t>(env_int("MAX_BUFFERED_FEEDS", 10000, 1, 10000000));
    cfg.forwarder.max_delivery_attempts = static_cast<unsigned>(env_int("MAX_DELIVERY_ATTEMPTS", 3, 1, 100));
    cfg.forwarder.retry_base = cfg.reconnect.base_delay;
    cfg.forwarder.retry_max = cfg.reconnect.max_delay;

    cfg.ingest_timeout = std::chrono::milliseconds(env_int("INGEST_TIMEOUT_MS", 10000, 100, 600000));
    cfg.status_port = static_cast<int>(env_int("STATUS_PORT", cfg.status_port, 1, 65535));
    cfg.log_level = env_string("LOG_LEVEL", cfg.log_level);

    cfg.validate();
    return cfg;
}

void CollectorConfig::validate() const
{
    if (worker_id.empty()) throw ConfigError("worker id is empty");
    if (api_base_url.rfind("http://", 0) != 0 && api_base_url.rfind("https://", 0) != 0) {
        throw ConfigError("API_BASE_URL must start with http:// or https://");
    }
    if (exchanges.empty()) throw ConfigError("no exchanges configured");

    const auto &registry = VenueRegistry::instance();
    std::set<std::string> seen;
    for (const auto &ex : exchanges) {
        if (!registry.find(ex)) throw ConfigError("unknown exchange '" + ex + "'");
        if (!seen.insert(ex).second) throw ConfigError("exchange '" + ex + "' listed twice");
    }

    if (symbols.empty()) throw ConfigError("no symbols configured");
    for (const auto &s : symbols) {
        if (!SymbolCodec::is_canonical(s)) throw ConfigError("symbol '" + s + "' is not BASE/QUOTE");
    }

    if (forwarder.batch_size < 1 || forwarder.batch_size > kMaxBatchFeeds) {
        throw ConfigError("batch size must be within 1.." + std::to_string(kMaxBatchFeeds));
    }
    if (reconnect.max_attempts == 0) throw ConfigError("max reconnect attempts must be positive");
    if (reconnect.max_delay < reconnect.base_delay) {
        throw ConfigError("RECONNECT_MAX_MS must not be below RECONNECT_BASE_MS");
    }
}
