#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "md/price_feed.hpp"
#include "md/symbol_codec.hpp"
#include "util/errors.hpp"

struct WsEndpoint {
    std::string host;
    unsigned short port{443};
    std::string target{"/"};
};

// Per-exchange wire format: subscription frame in, canonical PriceFeed out.
// parse_message() returns nullopt for acks, heartbeats and status events and
// throws ParseError when a ticker-shaped message cannot be decoded.
class IExchangeAdapter {
public:
    virtual ~IExchangeAdapter() = default;

    virtual const std::string &name() const = 0;
    virtual WsEndpoint endpoint() const = 0;
    virtual const std::vector<std::string> &symbols() const = 0;

    virtual std::string build_subscription() const = 0;
    virtual std::optional<PriceFeed> parse_message(const std::string &raw) = 0;
    virtual std::string normalize_symbol(const std::string &native) const = 0;
};

// Shared state for the concrete adapters: validated symbols and the worker id
// stamped on each feed.
class ExchangeAdapterBase : public IExchangeAdapter {
public:
    ExchangeAdapterBase(std::string name, std::vector<std::string> symbols, std::string worker_id)
        : name_(std::move(name)), symbols_(std::move(symbols)), worker_id_(std::move(worker_id)) {
        if (symbols_.empty()) {
            throw ConfigError("[" + name_ + "] no symbols configured");
        }
        for (const auto &s : symbols_) {
            if (!SymbolCodec::is_canonical(s)) {
                throw ConfigError("[" + name_ + "] symbol '" + s + "' is not BASE/QUOTE");
            }
            if (SymbolCodec::to_canonical(name_, SymbolCodec::to_venue(name_, s)) != s) {
                throw ConfigError("[" + name_ + "] symbol '" + s + "' has no stable venue mapping");
            }
        }
    }

    const std::string &name() const override { return name_; }
    const std::vector<std::string> &symbols() const override { return symbols_; }

    std::string normalize_symbol(const std::string &native) const override {
        return SymbolCodec::to_canonical(name_, native);
    }

protected:
    PriceFeed make_feed(std::string symbol, std::string price, Timestamp ts) const {
        PriceFeed f;
        f.symbol = std::move(symbol);
        f.price = std::move(price);
        f.timestamp = ts;
        f.source = name_;
        f.worker_id = worker_id_;
        return f;
    }

    std::string name_;
    std::vector<std::string> symbols_;
    std::string worker_id_;
};
