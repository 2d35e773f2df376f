#include "venues/binance/adapter.hpp"
#include "venues/coinbase/adapter.hpp"
#include "venues/kraken/adapter.hpp"
#include "venues/venue_registry.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    const std::vector<std::string> kSymbols{"BTC/USD", "ETH/USD"};
}

TEST(CoinbaseAdapter, SubscribesToTickerChannel)
{
    CoinbaseAdapter a(kSymbols, "worker-coinbase-us");
    EXPECT_EQ(a.endpoint().host, "ws-feed.exchange.coinbase.com");
    const auto sub = json::parse(a.build_subscription());
    EXPECT_EQ(sub["type"], "subscribe");
    EXPECT_EQ(sub["product_ids"], json::array({"BTC-USD", "ETH-USD"}));
    EXPECT_EQ(sub["channels"], json::array({"ticker"}));
}

TEST(CoinbaseAdapter, ParsesTicker)
{
    CoinbaseAdapter a(kSymbols, "worker-coinbase-us");
    const std::string raw = R"({"type":"ticker","sequence":37475248783,"product_id":"BTC-USD",)"
                            R"("price":"43250.50","open_24h":"42000.00","volume_24h":"12345.6789",)"
                            R"("best_bid":"43250.49","best_ask":"43250.51","side":"buy",)"
                            R"("time":"2024-01-15T10:30:00.123456Z","trade_id":512345,"last_size":"0.01"})";
    auto feed = a.parse_message(raw);
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->symbol, "BTC/USD");
    EXPECT_EQ(feed->price, "43250.50");
    ASSERT_TRUE(feed->volume.has_value());
    EXPECT_EQ(*feed->volume, "12345.6789");
    EXPECT_EQ(ts_to_ms(feed->timestamp), 1705314600123);
    EXPECT_EQ(feed->source, "coinbase");
    EXPECT_EQ(feed->worker_id, "worker-coinbase-us");
    EXPECT_EQ(feed->metadata["best_bid"], "43250.49");
    EXPECT_EQ(feed->metadata["trade_id"], 512345);
}

TEST(CoinbaseAdapter, IgnoresControlFrames)
{
    CoinbaseAdapter a(kSymbols, "w");
    EXPECT_FALSE(a.parse_message(R"({"type":"subscriptions","channels":[{"name":"ticker","product_ids":["BTC-USD"]}]})"));
    EXPECT_FALSE(a.parse_message(R"({"type":"heartbeat","sequence":1,"product_id":"BTC-USD"})"));
    EXPECT_FALSE(a.parse_message(R"({"type":"error","message":"Failed to subscribe"})"));
}

TEST(CoinbaseAdapter, MalformedTickerThrows)
{
    CoinbaseAdapter a(kSymbols, "w");
    EXPECT_THROW(a.parse_message(R"({"type":"ticker","product_id":"BTC-USD","price":"abc","time":"2024-01-15T10:30:00Z"})"),
                 ParseError);
    EXPECT_THROW(a.parse_message(R"({"type":"ticker","product_id":"BTC-USD","price":"1.5"})"), ParseError);
    EXPECT_THROW(a.parse_message(R"({"type":"ticker","price":"1.5","time":"2024-01-15T10:30:00Z"})"), ParseError);
}

TEST(KrakenAdapter, SubscribesWithXbtPairs)
{
    KrakenAdapter a(kSymbols, "w");
    const auto sub = json::parse(a.build_subscription());
    EXPECT_EQ(sub["event"], "subscribe");
    EXPECT_EQ(sub["pair"], json::array({"XBT/USD", "ETH/USD"}));
    EXPECT_EQ(sub["subscription"]["name"], "ticker");
}

TEST(KrakenAdapter, ParsesTickerArray)
{
    KrakenAdapter a(kSymbols, "worker-kraken-eu");
    const std::string raw = R"([340,{"a":["43251.10000",1,"1.000"],"b":["43250.90000",2,"2.000"],)"
                            R"("c":["43251.00000","0.00150000"],"v":["1200.5","3400.25"],)"
                            R"("p":["43100.1","43000.2"],"t":[1500,4200],"l":["42000.0","41900.0"],)"
                            R"("h":["43500.0","43600.0"],"o":["42800.0","42700.0"]},"ticker","XBT/USD"])";
    const auto before = now_ts();
    auto feed = a.parse_message(raw);
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->symbol, "BTC/USD");
    EXPECT_EQ(feed->price, "43251.00000");
    ASSERT_TRUE(feed->volume.has_value());
    EXPECT_EQ(*feed->volume, "3400.25");
    EXPECT_GE(feed->timestamp, before);
    EXPECT_EQ(feed->source, "kraken");
    EXPECT_EQ(feed->metadata["channel_id"], 340);
    EXPECT_EQ(feed->metadata["trades_24h"], 4200);
    EXPECT_EQ(feed->metadata["high_24h"], "43600.0");
}

TEST(KrakenAdapter, IgnoresEvents)
{
    KrakenAdapter a(kSymbols, "w");
    EXPECT_FALSE(a.parse_message(R"({"event":"heartbeat"})"));
    EXPECT_FALSE(a.parse_message(R"({"event":"systemStatus","status":"online","version":"1.9.1"})"));
    EXPECT_FALSE(a.parse_message(R"({"event":"subscriptionStatus","pair":"XBT/USD","status":"subscribed","subscription":{"name":"ticker"}})"));
    EXPECT_FALSE(a.parse_message(R"([340,[["43251.1","0.1","1705314600.1","b","l",""]],"trade","XBT/USD"])"));
}

TEST(KrakenAdapter, MalformedTickerThrows)
{
    KrakenAdapter a(kSymbols, "w");
    EXPECT_THROW(a.parse_message(R"([340,{"c":["not-a-price","1"]},"ticker","XBT/USD"])"), ParseError);
    EXPECT_THROW(a.parse_message(R"([340,{"c":[]},"ticker","XBT/USD"])"), ParseError);
}

TEST(BinanceAdapter, SubscribesToMiniTickerStreams)
{
    BinanceAdapter a(kSymbols, "w");
    EXPECT_EQ(a.endpoint().port, 9443);
    const auto sub = json::parse(a.build_subscription());
    EXPECT_EQ(sub["method"], "SUBSCRIBE");
    EXPECT_EQ(sub["params"], json::array({"btcusdt@miniTicker", "ethusdt@miniTicker"}));
}

TEST(BinanceAdapter, ParsesMiniTicker)
{
    BinanceAdapter a(kSymbols, "worker-binance-ap");
    const std::string raw = R"({"e":"24hrMiniTicker","E":1705314600123,"s":"BTCUSDT","c":"43250.01000000",)"
                            R"("o":"42000.00000000","h":"43500.00000000","l":"41900.00000000",)"
                            R"("v":"25000.12345000","q":"1070000000.00000000"})";
    auto feed = a.parse_message(raw);
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->symbol, "BTC/USD");
    EXPECT_EQ(feed->price, "43250.01000000");
    EXPECT_EQ(ts_to_ms(feed->timestamp), 1705314600123);
    EXPECT_EQ(feed->metadata["open"], "42000.00000000");
}

TEST(BinanceAdapter, ParsesCombinedStreamWrapper)
{
    BinanceAdapter a(kSymbols, "w");
    const std::string raw = R"({"stream":"ethusdt@miniTicker","data":{"e":"24hrMiniTicker","E":1705314600000,)"
                            R"("s":"ETHUSDT","c":"2500.5","o":"2400","h":"2600","l":"2390","v":"100","q":"250000"}})";
    auto feed = a.parse_message(raw);
    ASSERT_TRUE(feed.has_value());
    EXPECT_EQ(feed->symbol, "ETH/USD");
    EXPECT_EQ(feed->price, "2500.5");
}

TEST(BinanceAdapter, IgnoresAcksAndThrowsOnBadTicker)
{
    BinanceAdapter a(kSymbols, "w");
    EXPECT_FALSE(a.parse_message(R"({"result":null,"id":1})"));
    EXPECT_THROW(a.parse_message(R"({"e":"24hrMiniTicker","E":1705314600000,"s":"BTCUSDT","c":"-1"})"), ParseError);
    EXPECT_THROW(a.parse_message(R"({"e":"24hrMiniTicker","s":"BTCUSDT","c":"1.0"})"), ParseError);
}

TEST(VenueRegistry, BuildsKnownAdapters)
{
    const auto &registry = VenueRegistry::instance();
    EXPECT_EQ(registry.list_names(), (std::vector<std::string>{"binance", "coinbase", "kraken"}));
    auto adapter = registry.make_adapter("kraken", kSymbols, "w");
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->name(), "kraken");
    EXPECT_THROW(registry.make_adapter("mtgox", kSymbols, "w"), ConfigError);
}

TEST(VenueRegistry, RejectsBadSymbolLists)
{
    const auto &registry = VenueRegistry::instance();
    EXPECT_THROW(registry.make_adapter("coinbase", {}, "w"), ConfigError);
    EXPECT_THROW(registry.make_adapter("coinbase", {"btc-usd"}, "w"), ConfigError);
    // USDT would come back as USD
    EXPECT_THROW(registry.make_adapter("binance", {"BTC/USDT"}, "w"), ConfigError);
}
