#include "server/http_routes.hpp"
#include "util/logging.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

namespace
{
    struct RoutesFixture : ::testing::Test {
        std::shared_ptr<IFeedStore> store{make_memory_feed_store()};
        std::shared_ptr<PriceBroadcaster> broadcaster{std::make_shared<PriceBroadcaster>(8, make_silent_logger())};
        std::shared_ptr<PublishedPriceCache> cache{std::make_shared<PublishedPriceCache>(broadcaster, make_silent_logger())};
        IngestionGateway gateway{store, cache, make_silent_logger()};
        RouteContext ctx{gateway, *cache, *store};

        http::response<http::string_body> call(http::verb verb, const std::string &target,
                                               const std::string &body = "")
        {
            http::request<http::string_body> req{verb, target, 11};
            req.body() = body;
            req.prepare_payload();
            http::response<http::string_body> res;
            handle_request(ctx, req, res);
            return res;
        }
    };

    std::string ingest_body(const std::string &price)
    {
        IngestBatch b;
        b.worker_id = "worker-coinbase-us";
        b.timestamp = now_ts();
        b.feeds.push_back(make_test_feed("BTC/USD", price, "coinbase", now_ts() - std::chrono::milliseconds(50)));
        return encode_batch(b);
    }
}

TEST_F(RoutesFixture, Health)
{
    auto res = call(http::verb::get, "/api/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(json::parse(res.body())["store"], "memory");
}

TEST_F(RoutesFixture, IngestStatusCodes)
{
    auto ok = call(http::verb::post, "/internal/ingest", ingest_body("43250.50"));
    EXPECT_EQ(ok.result(), http::status::ok);
    EXPECT_EQ(json::parse(ok.body())["status"], "success");

    auto rejected = call(http::verb::post, "/internal/ingest", ingest_body("0"));
    EXPECT_EQ(rejected.result(), http::status::bad_request);
    const auto j = json::parse(rejected.body());
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["errors"][0]["index"], 0);

    auto malformed = call(http::verb::post, "/internal/ingest", "{oops");
    EXPECT_EQ(malformed.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(malformed.body())["status"], "error");

    auto wrong_method = call(http::verb::get, "/internal/ingest");
    EXPECT_EQ(wrong_method.result(), http::status::method_not_allowed);
}

TEST_F(RoutesFixture, LatestPricesFromCache)
{
    call(http::verb::post, "/internal/ingest", ingest_body("43250.50"));
    auto res = call(http::verb::get, "/v1/prices/latest?symbols=BTC/USD,ETH/USD");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto j = json::parse(res.body());
    ASSERT_EQ(j["data"].size(), 2u);
    EXPECT_EQ(j["data"][0]["symbol"], "BTC/USD");
    EXPECT_EQ(j["data"][0]["feeds"][0]["price"], "43250.50");
    EXPECT_TRUE(j["data"][0]["feeds"][0]["staleness_ms"].is_number());
    EXPECT_TRUE(j["data"][1]["feeds"].empty());

    EXPECT_EQ(call(http::verb::get, "/v1/prices/latest").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::get, "/v1/prices/latest?symbols=btcusd").result(), http::status::bad_request);
}

TEST_F(RoutesFixture, ConsensusReportsMissingSymbols)
{
    ConsensusRecord rec;
    rec.symbol = "BTC/USD";
    rec.price = rec.median = rec.mean = "101";
    rec.num_sources = 1;
    rec.sources = {"kraken"};
    rec.timestamp = now_ts();
    cache->publish(rec);

    auto res = call(http::verb::get, "/v1/consensus?symbols=BTC/USD,ETH/USD");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto j = json::parse(res.body());
    ASSERT_EQ(j["data"].size(), 1u);
    EXPECT_EQ(j["data"][0]["price"], "101");
    EXPECT_TRUE(j["data"][0]["std_dev"].is_null());
    EXPECT_EQ(j["missing"], json::array({"ETH/USD"}));
}

TEST_F(RoutesFixture, OhlcvBars)
{
    const std::int64_t t0 = 1705314600000;
    for (int i = 0; i < 3; ++i) {
        store->upsert_feed(make_test_feed("BTC/USD", std::to_string(100 + i), "coinbase", ts_from_ms(t0 + i * 1000)));
    }
    auto res = call(http::verb::get,
                    "/v1/prices/ohlcv?symbol=BTC/USD&interval=1m&from=2024-01-15T10:30:00Z&to=2024-01-15T10:31:00Z");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto j = json::parse(res.body());
    ASSERT_EQ(j["data"].size(), 1u);
    EXPECT_EQ(j["data"][0]["open"], "100");
    EXPECT_EQ(j["data"][0]["close"], "102");
    EXPECT_EQ(j["data"][0]["num_feeds"], 3);

    EXPECT_EQ(call(http::verb::get, "/v1/prices/ohlcv?symbol=BTC/USD&interval=7m").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::get,
                   "/v1/prices/ohlcv?symbol=BTC/USD&from=2024-01-01T00:00:00Z&to=2024-02-01T00:00:00Z").result(),
              http::status::bad_request);
}

TEST_F(RoutesFixture, UnknownPathIs404)
{
    EXPECT_EQ(call(http::verb::get, "/v1/nothing").result(), http::status::not_found);
}

TEST_F(RoutesFixture, MetricsExposition)
{
    EXPECT_EQ(call(http::verb::get, "/metrics").result(), http::status::not_found);

    auto metrics = std::make_shared<MetricsRegistry>();
    IngestionGateway metered{store, cache, make_silent_logger(), GatewayOptions{}, metrics};
    RouteContext with_metrics{metered, *cache, *store, metrics.get()};

    http::request<http::string_body> post{http::verb::post, "/internal/ingest", 11};
    post.body() = ingest_body("43250.50");
    post.prepare_payload();
    http::response<http::string_body> ingested;
    handle_request(with_metrics, post, ingested);
    ASSERT_EQ(ingested.result(), http::status::ok);

    http::request<http::string_body> get{http::verb::get, "/metrics", 11};
    http::response<http::string_body> res;
    handle_request(with_metrics, get, res);
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/plain; version=0.0.4");
    EXPECT_NE(res.body().find(
        "price_ingestions_total{worker_id=\"worker-coinbase-us\",symbol=\"BTC/USD\",status=\"success\"} 1"),
        std::string::npos);
    EXPECT_NE(res.body().find("price_ingestion_duration_ms_count{worker_id=\"worker-coinbase-us\"} 1"),
              std::string::npos);
}
