#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "util/time_format.hpp"

// One exchange's price observation for one symbol at one instant.
// price/volume hold the exchange's decimal text verbatim.
struct PriceFeed {
    std::string symbol;                 // canonical "BASE/QUOTE"
    std::string price;
    std::optional<std::string> volume;
    Timestamp timestamp{};
    std::string source;                 // exchange id, lower case
    std::string worker_id;
    nlohmann::json metadata = nlohmann::json::object();
};

// Upper bound on feeds per ingest request.
inline constexpr std::size_t kMaxBatchFeeds = 100;

struct IngestBatch {
    std::string worker_id;
    Timestamp timestamp{};
    std::vector<PriceFeed> feeds;
    // Feed index -> reason, for feeds the wire decoder could not read.
    std::map<std::size_t, std::string> malformed;
};

enum class IngestStatus { Success, Partial, Error };

inline const char *to_cstr(IngestStatus s)
{
    switch (s) {
    case IngestStatus::Success: return "success";
    case IngestStatus::Partial: return "partial";
    case IngestStatus::Error:   return "error";
    }
    return "error";
}

struct IngestItemError {
    std::size_t index{0};
    std::string symbol;
    std::string reason;
};

struct IngestResult {
    IngestStatus status{IngestStatus::Error};
    std::size_t ingested{0};
    std::size_t failed{0};
    std::int64_t latency_ms{0};
    std::string message;
    std::vector<IngestItemError> errors;
};

// Fused price for one symbol. Prices are decimal strings.
struct ConsensusRecord {
    std::string symbol;
    std::string price;                  // == median
    std::string median;
    std::string mean;
    std::optional<std::string> std_dev; // absent below two sources
    std::size_t num_sources{0};
    Timestamp timestamp{};
    std::set<std::string> sources;
};

enum class ConnectionState { Disconnected, Connecting, Connected, Reconnecting, Failed };

inline const char *to_cstr(ConnectionState s)
{
    switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Reconnecting: return "reconnecting";
    case ConnectionState::Failed:       return "failed";
    }
    return "unknown";
}
