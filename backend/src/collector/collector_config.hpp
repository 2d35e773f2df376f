#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "collector/backoff.hpp"
#include "collector/batch_forwarder.hpp"

struct CollectorConfig {
    std::string worker_id;
    std::string api_base_url;
    std::vector<std::string> exchanges;
    std::vector<std::string> symbols{"BTC/USD", "ETH/USD"};
    ReconnectPolicy reconnect;
    ForwarderOptions forwarder;
    std::chrono::milliseconds ingest_timeout{10000};
    int status_port{8081};
    std::string log_level{"info"};

    // Reads the environment and validates it. Throws ConfigError.
    static CollectorConfig from_env();

    // Field checks shared by from_env() and tests.
    void validate() const;
};

// "worker-coinbase-us" -> "coinbase"; empty when the id does not follow that shape.
std::string exchange_from_worker_id(const std::string &worker_id);
