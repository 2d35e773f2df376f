#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <curl/curl.h>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "collector/batch_forwarder.hpp"
#include "collector/collector_config.hpp"
#include "collector/connection_manager.hpp"
#include "collector/http_ingest_client.hpp"
#include "collector/status_routes.hpp"
#include "server/http_server.hpp"
#include "util/env_config.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "venues/venue_registry.hpp"
#include "ws/ws.hpp"

using tcp = boost::asio::ip::tcp;

int main()
{
    load_env_file();

    CollectorConfig cfg;
    try {
        cfg = CollectorConfig::from_env();
    } catch (const ConfigError &e) {
        std::cerr << "config: " << e.what() << std::endl;
        return 2;
    }
    init_logging(cfg.log_level);
    auto log = make_logger("main");

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        log->critical("curl_global_init failed");
        return 1;
    }

    int rc = 0;
    try {
        auto client = std::make_shared<HttpIngestClient>(cfg.api_base_url, cfg.ingest_timeout);
        auto metrics = std::make_shared<MetricsRegistry>();
        BatchForwarder forwarder(client, cfg.forwarder, make_logger("forwarder"), metrics);
        forwarder.start();
        log->info("worker={} forwarding to {}", cfg.worker_id, client->url());

        // Adapters are all built before any connection opens so a bad
        // symbol list fails the process up front.
        const auto &registry = VenueRegistry::instance();
        std::vector<std::unique_ptr<IExchangeAdapter>> adapters;
        for (const auto &ex : cfg.exchanges) {
            adapters.push_back(registry.make_adapter(ex, cfg.symbols, cfg.worker_id));
        }

        std::vector<std::unique_ptr<ConnectionManager>> connections;
        for (auto &adapter : adapters) {
            const std::string name = adapter->name();
            connections.push_back(std::make_unique<ConnectionManager>(
                std::move(adapter),
                std::make_unique<BeastWsTransport>(),
                [&forwarder](PriceFeed feed) { forwarder.add(std::move(feed)); },
                cfg.reconnect,
                make_logger("conn." + name)));
        }
        for (auto &c : connections) c->connect();

        boost::asio::io_context ioc{1};
        tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), static_cast<unsigned short>(cfg.status_port)};
        CollectorView view{cfg.worker_id, connections, forwarder, metrics.get()};
        HttpServer status{ioc, ep, [&view](auto const &req, auto &res) {
            handle_status_request(view, req, res);
        }, make_logger("http")};
        status.run();
        log->info("status listening on :{}", cfg.status_port);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int sig) {
            log->info("signal {} received; shutting down", sig);
            status.stop();
            ioc.stop();
        });

        ioc.run();

        for (auto &c : connections) c->disconnect();
        forwarder.stop();

        const auto s = forwarder.stats();
        log->info("forwarder totals sent={} ingested={} rejected={} dropped={} evicted={}",
                  s.batches_sent, s.feeds_ingested, s.feeds_rejected, s.feeds_dropped, s.feeds_evicted);
    } catch (const ConfigError &e) {
        log->critical("config: {}", e.what());
        rc = 2;
    } catch (const std::exception &e) {
        log->critical("fatal: {}", e.what());
        rc = 1;
    }

    curl_global_cleanup();
    shutdown_logging();
    return rc;
}
