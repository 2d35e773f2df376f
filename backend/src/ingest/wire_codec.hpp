#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "md/price_feed.hpp"

// JSON shapes of the ingestion boundary and the read/stream surfaces.
// Decimals always travel as strings, instants as ISO-8601 UTC.

nlohmann::json feed_to_json(const PriceFeed &feed);
nlohmann::json consensus_to_json(const ConsensusRecord &rec);
nlohmann::json result_to_json(const IngestResult &res);

std::string encode_batch(const IngestBatch &batch);

// Throws WireFormatError when `body` is not a JSON object or `feeds` is not an array.
// Individual feed fields are taken leniently: a missing or mistyped field is
// left empty so per-item validation reports it against its index. Feeds that
// cannot be represented at all (no readable timestamp, not an object) are
// listed in IngestBatch::malformed.
IngestBatch decode_batch(std::string_view body);

// Throws WireFormatError when the body is not a well-formed result.
IngestResult decode_result(std::string_view body);
