#pragma once
#include "venues/exchange_adapter.hpp"
#include "util/decimal.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <string>
#include <vector>

// Kraken public WebSocket v1, "ticker" subscription.
// Updates arrive as [channelID, {a,b,c,v,p,t,l,h,o}, "ticker", "XBT/USD"];
// everything else is an {"event":...} object.
class KrakenAdapter : public ExchangeAdapterBase {
public:
    KrakenAdapter(std::vector<std::string> symbols, std::string worker_id)
        : ExchangeAdapterBase("kraken", std::move(symbols), std::move(worker_id)) {}

    WsEndpoint endpoint() const override {
        return {"ws.kraken.com", 443, "/"};
    }

    std::string build_subscription() const override {
        nlohmann::json pairs = nlohmann::json::array();
        for (const auto &s : symbols_) pairs.push_back(SymbolCodec::to_venue(name_, s));
        nlohmann::json sub = {
            {"event", "subscribe"},
            {"pair", pairs},
            {"subscription", {{"name", "ticker"}}},
        };
        return sub.dump();
    }

    std::optional<PriceFeed> parse_message(const std::string &raw) override {
        const auto first = raw.find_first_not_of(" \t\r\n");
        if (first == std::string::npos || raw[first] != '[') return std::nullopt;
        if (raw.find("\"ticker\"") == std::string::npos) return std::nullopt;

        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) {
            throw ParseError("[kraken] iterate failed");
        }
        simdjson::ondemand::array arr;
        if (doc.get_array().get(arr)) {
            throw ParseError("[kraken] ticker frame is not an array");
        }

        std::int64_t channel_id = -1;
        std::vector<std::string> ask, bid, close, volume, vwap, low, high, open;
        std::vector<std::int64_t> trades;
        std::string channel, pair;
        bool have_body = false;

        std::size_t idx = 0;
        for (auto elem : arr) {
            if (idx == 0) {
                if (elem.get_int64().get(channel_id)) channel_id = -1;
            } else if (idx == 1) {
                simdjson::ondemand::object body;
                if (!elem.get_object().get(body)) {
                    have_body = true;
                    ask = string_items(body, "a");
                    bid = string_items(body, "b");
                    close = string_items(body, "c");
                    volume = string_items(body, "v");
                    vwap = string_items(body, "p");
                    trades = int_items(body, "t");
                    low = string_items(body, "l");
                    high = string_items(body, "h");
                    open = string_items(body, "o");
                }
            } else if (idx == 2) {
                std::string_view sv;
                if (!elem.get_string().get(sv)) channel = std::string(sv);
            } else if (idx == 3) {
                std::string_view sv;
                if (!elem.get_string().get(sv)) pair = std::string(sv);
            }
            ++idx;
        }

        if (channel != "ticker") return std::nullopt;
        if (!have_body || pair.empty()) {
            throw ParseError("[kraken] ticker frame missing body or pair");
        }
        if (close.empty() || !Decimal::is_plain(close[0])) {
            throw ParseError("[kraken] bad last trade price for " + pair);
        }

        // v1 ticker carries no exchange timestamp
        PriceFeed feed = make_feed(normalize_symbol(pair), close[0], now_ts());

        if (volume.size() > 1) {
            if (!Decimal::is_plain(volume[1])) {
                throw ParseError("[kraken] bad 24h volume for " + pair);
            }
            feed.volume = volume[1];
        }

        if (channel_id >= 0) feed.metadata["channel_id"] = channel_id;
        if (!ask.empty()) feed.metadata["ask"] = ask[0];
        if (!bid.empty()) feed.metadata["bid"] = bid[0];
        if (high.size() > 1) feed.metadata["high_24h"] = high[1];
        if (low.size() > 1) feed.metadata["low_24h"] = low[1];
        if (vwap.size() > 1) feed.metadata["vwap_24h"] = vwap[1];
        if (trades.size() > 1) feed.metadata["trades_24h"] = trades[1];
        if (!open.empty()) feed.metadata["open_today"] = open[0];
        return feed;
    }

private:
    // String members of body[key]; numeric members are skipped.
    static std::vector<std::string> string_items(simdjson::ondemand::object &body, const char *key) {
        std::vector<std::string> out;
        simdjson::ondemand::array items;
        if (body[key].get_array().get(items)) return out;
        for (auto item : items) {
            std::string_view sv;
            if (!item.get_string().get(sv)) out.emplace_back(sv);
        }
        return out;
    }

    static std::vector<std::int64_t> int_items(simdjson::ondemand::object &body, const char *key) {
        std::vector<std::int64_t> out;
        simdjson::ondemand::array items;
        if (body[key].get_array().get(items)) return out;
        for (auto item : items) {
            std::int64_t v = 0;
            if (!item.get_int64().get(v)) out.push_back(v);
        }
        return out;
    }

    simdjson::ondemand::parser parser_;
};
