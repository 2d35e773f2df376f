#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include "cache/broadcaster.hpp"
#include "cache/price_cache.hpp"
#include "consensus/consensus_aggregator.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "server/gateway_config.hpp"
#include "server/http_routes.hpp"
#include "server/http_server.hpp"
#include "server/stream_server.hpp"
#include "storage/feed_store.hpp"
#include "util/env_config.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

using tcp = boost::asio::ip::tcp;

namespace
{
    std::shared_ptr<IFeedStore> open_store(const GatewayConfig &cfg, spdlog::logger &log)
    {
        if (cfg.database_url.empty()) {
            log.warn("DATABASE_URL not set; using in-memory store");
            return make_memory_feed_store();
        }
        try {
            auto store = make_pg_feed_store(cfg.database_url, cfg.schema_path);
            log.info("database connected");
            return store;
        } catch (const StorageError &e) {
            log.error("database unavailable: {}; falling back to in-memory store", e.what());
            return make_memory_feed_store();
        }
    }

    // Stops and joins the stream thread on every exit path.
    struct StreamThread {
        StreamServer &stream;
        std::thread thread;

        ~StreamThread()
        {
            stream.stop();
            if (thread.joinable()) thread.join();
        }
    };
}

int main()
{
    load_env_file();

    GatewayConfig cfg;
    try {
        cfg = GatewayConfig::from_env();
    } catch (const ConfigError &e) {
        std::cerr << "config: " << e.what() << std::endl;
        return 2;
    }
    init_logging(cfg.log_level);
    auto log = make_logger("main");

    try {
        auto store = open_store(cfg, *log);
        auto broadcaster = std::make_shared<PriceBroadcaster>(cfg.subscriber_queue, make_logger("stream"));
        auto cache = std::make_shared<PublishedPriceCache>(broadcaster, make_logger("cache"));
        auto metrics = std::make_shared<MetricsRegistry>();
        auto gateway = std::make_shared<IngestionGateway>(store, cache, make_logger("gateway"), GatewayOptions{}, metrics);

        AggregatorOptions agg_opts;
        agg_opts.symbols = cfg.consensus_symbols;
        agg_opts.window = cfg.consensus_window;
        agg_opts.interval = cfg.consensus_interval;
        agg_opts.minimum_sources = cfg.consensus_min_sources;
        ConsensusAggregator aggregator(store, cache, agg_opts, make_logger("consensus"));
        aggregator.start();

        boost::asio::io_context ioc{1};
        tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), static_cast<unsigned short>(cfg.http_port)};
        RouteContext ctx{*gateway, *cache, *store, metrics.get()};
        HttpServer server{ioc, ep, [&ctx](auto const &req, auto &res) {
            handle_request(ctx, req, res);
        }, make_logger("http")};

        StreamServer::Options stream_opts;
        stream_opts.port = cfg.stream_port;
        stream_opts.queue_capacity = cfg.subscriber_queue;
        stream_opts.max_connections = cfg.stream_max_connections;
        stream_opts.heartbeat_interval = cfg.stream_heartbeat;
        StreamServer stream(broadcaster, stream_opts, make_logger("stream"), metrics);
        StreamThread stream_thread{stream, std::thread([&] {
            try {
                stream.run();
            } catch (const std::exception &e) {
                log->error("stream server: {}", e.what());
            }
        })};

        server.run();
        log->info("http listening on :{} store={}", cfg.http_port, store->kind());

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int sig) {
            log->info("signal {} received; shutting down", sig);
            server.stop();
            stream.stop();
            ioc.stop();
        });

        ioc.run();

        aggregator.stop();
    } catch (const std::exception &e) {
        log->critical("fatal: {}", e.what());
        shutdown_logging();
        return 1;
    }

    log->info("gateway stopped");
    shutdown_logging();
    return 0;
}
