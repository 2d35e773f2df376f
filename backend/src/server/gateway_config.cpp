#include "server/gateway_config.hpp"
#include "md/symbol_codec.hpp"
#include "util/env_config.hpp"
#include "util/errors.hpp"

GatewayConfig GatewayConfig::from_env()
{
    GatewayConfig cfg;
    cfg.http_port = static_cast<int>(env_int("HTTP_PORT", cfg.http_port, 1, 65535));
    cfg.stream_port = static_cast<int>(env_int("STREAM_PORT", cfg.stream_port, 1, 65535));
    if (cfg.http_port == cfg.stream_port) {
        throw ConfigError("HTTP_PORT and STREAM_PORT must differ");
    }
    cfg.database_url = env_string("DATABASE_URL");
    cfg.schema_path = env_string("SCHEMA_SQL_PATH", cfg.schema_path);

    cfg.consensus_symbols = env_list("CONSENSUS_SYMBOLS");
    for (const auto &s : cfg.consensus_symbols) {
        if (!SymbolCodec::is_canonical(s)) {
            throw ConfigError("CONSENSUS_SYMBOLS: '" + s + "' is not BASE/QUOTE");
        }
    }

    cfg.consensus_interval = std::chrono::milliseconds(env_int("CONSENSUS_INTERVAL_MS", 5000, 100, 3600000));
    cfg.consensus_window = std::chrono::milliseconds(env_int("CONSENSUS_WINDOW_MS", 10000, 100, 86400000));
    cfg.consensus_min_sources = static_cast<std::size_t>(env_int("CONSENSUS_MIN_SOURCES", 1, 1, 100));
    cfg.subscriber_queue = static_cast<std::size_t>(env_int("SUBSCRIBER_QUEUE", 256, 1, 1000000));
    cfg.stream_max_connections = static_cast<std::size_t>(env_int("WS_MAX_CONNECTIONS", 10000, 1, 1000000));
    cfg.stream_heartbeat = std::chrono::milliseconds(env_int("WS_HEARTBEAT_INTERVAL_MS", 30000, 1000, 3600000));
    cfg.log_level = env_string("LOG_LEVEL", cfg.log_level);
    return cfg;
}
