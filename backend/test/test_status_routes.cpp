#include "collector/status_routes.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "venues/kraken/adapter.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

namespace
{
    // Never connects.
    class RefusingTransport : public IWsTransport {
    public:
        void open(const WsEndpoint &) override { throw TransportError("refused"); }
        void write(const std::string &) override {}
        bool read(std::string &) override { return false; }
        void close() noexcept override {}
    };

    class NullClient : public IIngestClient {
    public:
        IngestResult deliver(const IngestBatch &batch) override {
            IngestResult r;
            r.status = IngestStatus::Success;
            r.ingested = batch.feeds.size();
            return r;
        }
    };
}

TEST(StatusRoutes, ReportsConnectionsAndForwarder)
{
    BatchForwarder forwarder(std::make_shared<NullClient>(), ForwarderOptions{"worker-kraken-eu"}, make_silent_logger());
    std::vector<std::unique_ptr<ConnectionManager>> connections;
    connections.push_back(std::make_unique<ConnectionManager>(
        std::make_unique<KrakenAdapter>(std::vector<std::string>{"BTC/USD"}, "worker-kraken-eu"),
        std::make_unique<RefusingTransport>(),
        [](PriceFeed) {},
        ReconnectPolicy{},
        make_silent_logger()));

    CollectorView view{"worker-kraken-eu", connections, forwarder};

    http::request<http::string_body> req{http::verb::get, "/status", 11};
    http::response<http::string_body> res;
    handle_status_request(view, req, res);
    ASSERT_EQ(res.result(), http::status::ok);
    const auto j = json::parse(res.body());
    EXPECT_EQ(j["worker_id"], "worker-kraken-eu");
    ASSERT_EQ(j["connections"].size(), 1u);
    EXPECT_EQ(j["connections"][0]["exchange"], "kraken");
    EXPECT_EQ(j["connections"][0]["state"], "disconnected");
    EXPECT_EQ(j["forwarder"]["buffered"], 0);

    // nothing is connected
    http::request<http::string_body> health{http::verb::get, "/health", 11};
    http::response<http::string_body> hres;
    handle_status_request(view, health, hres);
    EXPECT_EQ(hres.result(), http::status::service_unavailable);

    http::request<http::string_body> reconnect{http::verb::post, "/reconnect", 11};
    http::response<http::string_body> rres;
    handle_status_request(view, reconnect, rres);
    EXPECT_EQ(rres.result(), http::status::ok);
    EXPECT_TRUE(json::parse(rres.body())["restarted"].empty());

    http::request<http::string_body> other{http::verb::get, "/metrics", 11};
    http::response<http::string_body> ores;
    handle_status_request(view, other, ores);
    EXPECT_EQ(ores.result(), http::status::not_found);
}

TEST(StatusRoutes, ConnectionSnapshotJson)
{
    ConnectionStatus s;
    s.exchange = "coinbase";
    s.state = ConnectionState::Failed;
    s.reconnect_attempts = 10;
    s.max_attempts = 10;
    s.last_error = "refused";
    const auto j = connection_to_json(s);
    EXPECT_EQ(j["state"], "failed");
    EXPECT_EQ(j["reconnect_attempts"], 10);
    EXPECT_EQ(j["last_error"], "refused");

    s.last_error.clear();
    EXPECT_TRUE(connection_to_json(s)["last_error"].is_null());
}

TEST(StatusRoutes, MetricsExposition)
{
    auto metrics = std::make_shared<MetricsRegistry>();
    ForwarderOptions opts{"worker-kraken-eu"};
    opts.max_buffered = opts.batch_size;
    BatchForwarder forwarder(std::make_shared<NullClient>(), opts, make_silent_logger(), metrics);
    for (std::size_t i = 0; i <= opts.batch_size; ++i) {
        PriceFeed f;
        f.symbol = "BTC/USD";
        f.price = "1";
        f.source = "kraken";
        forwarder.add(f);
    }
    std::vector<std::unique_ptr<ConnectionManager>> connections;
    CollectorView view{"worker-kraken-eu", connections, forwarder, metrics.get()};

    http::request<http::string_body> req{http::verb::get, "/metrics", 11};
    http::response<http::string_body> res;
    handle_status_request(view, req, res);
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/plain; version=0.0.4");
    EXPECT_NE(res.body().find("collector_feeds_lost_total{worker_id=\"worker-kraken-eu\",reason=\"evicted\"} 1"),
              std::string::npos);

    CollectorView bare{"worker-kraken-eu", connections, forwarder};
    http::response<http::string_body> missing;
    handle_status_request(bare, req, missing);
    EXPECT_EQ(missing.result(), http::status::not_found);
}
