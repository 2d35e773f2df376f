#include "ingest/wire_codec.hpp"
#include "util/errors.hpp"

#include <optional>

using json = nlohmann::json;

namespace
{
    std::string string_or_empty(const json &obj, const char *key)
    {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) return "";
        return it->get<std::string>();
    }

    std::optional<Timestamp> timestamp_field(const json &obj, const char *key)
    {
        const std::string raw = string_or_empty(obj, key);
        if (raw.empty()) return std::nullopt;
        return parse_iso8601(raw);
    }

    // `problem` is set when the feed cannot be validated as sent.
    PriceFeed decode_feed(const json &j, const std::string &worker_id, std::string &problem)
    {
        PriceFeed f;
        f.worker_id = worker_id;
        if (!j.is_object()) {
            problem = "price feed must be a JSON object";
            return f;
        }
        f.symbol = string_or_empty(j, "symbol");
        f.price = string_or_empty(j, "price");
        f.source = string_or_empty(j, "source");
        if (auto ts = timestamp_field(j, "timestamp")) f.timestamp = *ts;
        else problem = "timestamp must be ISO 8601 format";
        auto vol = j.find("volume");
        if (vol != j.end() && !vol->is_null()) {
            // a non-string volume becomes "" and fails validation
            f.volume = vol->is_string() ? vol->get<std::string>() : std::string();
        }
        auto meta = j.find("metadata");
        if (meta != j.end() && meta->is_object()) f.metadata = *meta;
        return f;
    }

    IngestStatus status_from_string(const std::string &s)
    {
        if (s == "success") return IngestStatus::Success;
        if (s == "partial") return IngestStatus::Partial;
        if (s == "error") return IngestStatus::Error;
        throw WireFormatError("unknown ingest status '" + s + "'");
    }
}

json feed_to_json(const PriceFeed &feed)
{
    json j = {
        {"symbol", feed.symbol},
        {"price", feed.price},
        {"source", feed.source},
        {"timestamp", format_iso8601(feed.timestamp)},
    };
    if (feed.volume) j["volume"] = *feed.volume;
    if (!feed.metadata.is_null() && !feed.metadata.empty()) j["metadata"] = feed.metadata;
    return j;
}

json consensus_to_json(const ConsensusRecord &rec)
{
    json j = {
        {"symbol", rec.symbol},
        {"price", rec.price},
        {"median", rec.median},
        {"mean", rec.mean},
        {"std_dev", rec.std_dev ? json(*rec.std_dev) : json(nullptr)},
        {"num_sources", rec.num_sources},
        {"sources", rec.sources},
        {"timestamp", format_iso8601(rec.timestamp)},
    };
    return j;
}

json result_to_json(const IngestResult &res)
{
    json j = {
        {"status", to_cstr(res.status)},
        {"ingested", res.ingested},
        {"failed", res.failed},
        {"latency_ms", res.latency_ms},
        {"message", res.message},
    };
    if (!res.errors.empty()) {
        json errs = json::array();
        for (const auto &e : res.errors) {
            errs.push_back({{"index", e.index}, {"symbol", e.symbol}, {"error", e.reason}});
        }
        j["errors"] = std::move(errs);
    }
    return j;
}

std::string encode_batch(const IngestBatch &batch)
{
    json feeds = json::array();
    for (const auto &f : batch.feeds) feeds.push_back(feed_to_json(f));
    json body = {
        {"worker_id", batch.worker_id},
        {"timestamp", format_iso8601(batch.timestamp)},
        {"feeds", std::move(feeds)},
    };
    return body.dump();
}

IngestBatch decode_batch(std::string_view body)
{
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw WireFormatError("request body is not valid JSON");
    if (!j.is_object()) throw WireFormatError("request body must be a JSON object");

    IngestBatch batch;
    batch.worker_id = string_or_empty(j, "worker_id");
    // informational only; a missing header stamp becomes receipt time
    batch.timestamp = timestamp_field(j, "timestamp").value_or(now_ts());

    auto feeds = j.find("feeds");
    if (feeds == j.end()) return batch;
    if (!feeds->is_array()) throw WireFormatError("feeds must be an array");
    batch.feeds.reserve(feeds->size());
    for (const auto &f : *feeds) {
        std::string problem;
        batch.feeds.push_back(decode_feed(f, batch.worker_id, problem));
        if (!problem.empty()) batch.malformed.emplace(batch.feeds.size() - 1, std::move(problem));
    }
    return batch;
}

IngestResult decode_result(std::string_view body)
{
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw WireFormatError("ingest response is not a JSON object");
    try {
        IngestResult res;
        res.status = status_from_string(j.at("status").get<std::string>());
        res.ingested = j.at("ingested").get<std::size_t>();
        res.failed = j.at("failed").get<std::size_t>();
        res.latency_ms = j.value("latency_ms", std::int64_t{0});
        res.message = j.value("message", std::string());
        if (auto errs = j.find("errors"); errs != j.end() && errs->is_array()) {
            for (const auto &e : *errs) {
                IngestItemError item;
                item.index = e.value("index", std::size_t{0});
                item.symbol = e.value("symbol", std::string());
                item.reason = e.value("error", std::string());
                res.errors.push_back(std::move(item));
            }
        }
        return res;
    } catch (const json::exception &e) {
        throw WireFormatError(std::string("ingest response: ") + e.what());
    }
}
