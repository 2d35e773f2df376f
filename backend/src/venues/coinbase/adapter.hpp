#pragma once
#include "venues/exchange_adapter.hpp"
#include "util/decimal.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <string>
#include <vector>

// Coinbase Exchange public feed, "ticker" channel.
// {"type":"ticker","product_id":"BTC-USD","price":"50000.01","time":"...Z","volume_24h":"...",...}
class CoinbaseAdapter : public ExchangeAdapterBase {
public:
    CoinbaseAdapter(std::vector<std::string> symbols, std::string worker_id)
        : ExchangeAdapterBase("coinbase", std::move(symbols), std::move(worker_id)) {}

    WsEndpoint endpoint() const override {
        return {"ws-feed.exchange.coinbase.com", 443, "/"};
    }

    std::string build_subscription() const override {
        nlohmann::json product_ids = nlohmann::json::array();
        for (const auto &s : symbols_) product_ids.push_back(SymbolCodec::to_venue(name_, s));
        nlohmann::json sub = {
            {"type", "subscribe"},
            {"product_ids", product_ids},
            {"channels", nlohmann::json::array({"ticker"})},
        };
        return sub.dump();
    }

    std::optional<PriceFeed> parse_message(const std::string &raw) override {
        // subscriptions, heartbeat, error frames never carry this marker
        if (raw.find("\"ticker\"") == std::string::npos) return std::nullopt;

        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) {
            throw ParseError("[coinbase] iterate failed");
        }
        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj)) return std::nullopt;

        std::string_view type_sv;
        if (obj["type"].get_string().get(type_sv) || type_sv != "ticker") return std::nullopt;

        std::string_view product_sv, price_sv, time_sv;
        if (obj["product_id"].get_string().get(product_sv)) {
            throw ParseError("[coinbase] ticker without product_id");
        }
        const std::string product(product_sv);
        if (obj["price"].get_string().get(price_sv) || !Decimal::is_plain(price_sv)) {
            throw ParseError("[coinbase] bad price for " + product);
        }
        const std::string price(price_sv);
        if (obj["time"].get_string().get(time_sv)) {
            throw ParseError("[coinbase] ticker without time for " + product);
        }
        auto ts = parse_iso8601(time_sv);
        if (!ts) {
            throw ParseError("[coinbase] bad time '" + std::string(time_sv) + "' for " + product);
        }

        PriceFeed feed = make_feed(normalize_symbol(product), price, *ts);

        std::string_view vol_sv;
        if (!obj["volume_24h"].get_string().get(vol_sv)) {
            if (!Decimal::is_plain(vol_sv)) {
                throw ParseError("[coinbase] bad volume_24h for " + product);
            }
            feed.volume = std::string(vol_sv);
        }

        std::uint64_t seq = 0, trade_id = 0;
        if (!obj["sequence"].get_uint64().get(seq)) feed.metadata["sequence"] = seq;
        if (!obj["trade_id"].get_uint64().get(trade_id)) feed.metadata["trade_id"] = trade_id;
        std::string_view bid_sv, ask_sv;
        if (!obj["best_bid"].get_string().get(bid_sv)) feed.metadata["best_bid"] = std::string(bid_sv);
        if (!obj["best_ask"].get_string().get(ask_sv)) feed.metadata["best_ask"] = std::string(ask_sv);
        return feed;
    }

private:
    simdjson::ondemand::parser parser_;
};
