#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

struct GatewayConfig {
    int http_port{8080};
    int stream_port{9001};
    std::string database_url;          // empty: in-memory store
    std::string schema_path{"sql/schema.sql"};
    std::vector<std::string> consensus_symbols;
    std::chrono::milliseconds consensus_interval{5000};
    std::chrono::milliseconds consensus_window{10000};
    std::size_t consensus_min_sources{1};
    std::size_t subscriber_queue{256};
    std::size_t stream_max_connections{10000};
    std::chrono::milliseconds stream_heartbeat{30000};
    std::string log_level{"info"};

    // Reads the environment; throws ConfigError on malformed values.
    static GatewayConfig from_env();
};
