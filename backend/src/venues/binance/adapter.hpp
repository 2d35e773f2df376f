#pragma once
#include "venues/exchange_adapter.hpp"
#include "util/decimal.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

// Binance spot streams, "<symbol>@miniTicker".
// {"e":"24hrMiniTicker","E":1672515782136,"s":"BTCUSDT","c":"0.0025","o":..,"h":..,"l":..,"v":..,"q":..}
// Combined streams wrap the payload as {"stream":"..","data":{...}}.
class BinanceAdapter : public ExchangeAdapterBase {
public:
    BinanceAdapter(std::vector<std::string> symbols, std::string worker_id)
        : ExchangeAdapterBase("binance", std::move(symbols), std::move(worker_id)) {}

    WsEndpoint endpoint() const override {
        return {"stream.binance.com", 9443, "/ws"};
    }

    std::string build_subscription() const override {
        nlohmann::json params = nlohmann::json::array();
        for (const auto &s : symbols_) {
            std::string stream = SymbolCodec::to_venue(name_, s);
            for (auto &ch : stream) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            params.push_back(stream + "@miniTicker");
        }
        nlohmann::json sub = {{"method", "SUBSCRIBE"}, {"params", params}, {"id", 1}};
        return sub.dump();
    }

    std::optional<PriceFeed> parse_message(const std::string &raw) override {
        if (raw.find("Ticker\"") == std::string::npos) return std::nullopt;

        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) {
            throw ParseError("[binance] iterate failed");
        }
        simdjson::ondemand::object root;
        if (doc.get_object().get(root)) return std::nullopt;

        if (raw.find("\"data\"") != std::string::npos) {
            simdjson::ondemand::object data;
            if (root["data"].get_object().get(data)) return std::nullopt;
            return parse_ticker(data);
        }
        return parse_ticker(root);
    }

private:
    std::optional<PriceFeed> parse_ticker(simdjson::ondemand::object &obj) {
        std::string_view event_sv;
        if (obj["e"].get_string().get(event_sv)) return std::nullopt;
        const bool full = event_sv == "24hrTicker";
        if (!full && event_sv != "24hrMiniTicker") return std::nullopt;

        std::string_view sym_sv, close_sv;
        if (obj["s"].get_string().get(sym_sv)) {
            throw ParseError("[binance] ticker without symbol");
        }
        const std::string native(sym_sv);
        if (obj["c"].get_string().get(close_sv) || !Decimal::is_plain(close_sv)) {
            throw ParseError("[binance] bad close price for " + native);
        }
        const std::string price(close_sv);
        std::int64_t event_ms = 0;
        if (obj["E"].get_int64().get(event_ms) || event_ms <= 0) {
            throw ParseError("[binance] bad event time for " + native);
        }

        PriceFeed feed = make_feed(normalize_symbol(native), price, ts_from_ms(event_ms));

        std::string_view vol_sv;
        if (!obj["v"].get_string().get(vol_sv)) {
            if (!Decimal::is_plain(vol_sv)) {
                throw ParseError("[binance] bad volume for " + native);
            }
            feed.volume = std::string(vol_sv);
        }

        copy_string(obj, "o", "open", feed);
        copy_string(obj, "h", "high", feed);
        copy_string(obj, "l", "low", feed);
        copy_string(obj, "q", "quote_volume", feed);
        if (full) {
            copy_string(obj, "b", "best_bid", feed);
            copy_string(obj, "a", "best_ask", feed);
            std::int64_t trades = 0;
            if (!obj["n"].get_int64().get(trades)) feed.metadata["trades"] = trades;
        }
        return feed;
    }

    static void copy_string(simdjson::ondemand::object &obj, const char *key,
                            const char *meta_key, PriceFeed &feed) {
        std::string_view sv;
        if (!obj[key].get_string().get(sv)) feed.metadata[meta_key] = std::string(sv);
    }

    simdjson::ondemand::parser parser_;
};
