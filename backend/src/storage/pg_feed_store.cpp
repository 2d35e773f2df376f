#include "storage/feed_store.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <fstream>
#include <iostream>
#include <sstream>

// PostgreSQL-backed feed store via libpqxx. One connection per call.
class PgFeedStore final : public IFeedStore {
public:
    PgFeedStore(const std::string& connection_string, const std::string& schema_path)
        : conn_str_(with_connect_timeout(connection_string)) {
        try {
            auto conn = std::make_unique<pqxx::connection>(conn_str_);
            ensure_schema(*conn, schema_path);
        } catch (const StorageError&) {
            throw;
        } catch (const std::exception& e) {
            throw StorageError("Failed to connect to database: " + std::string(e.what()));
        }
    }

    void upsert_feed(const PriceFeed& feed) override {
        static const std::string query = R"(
            INSERT INTO price_feeds (symbol, price, volume, timestamp, source, worker_id, metadata)
            VALUES ($1, $2::numeric, $3::numeric, $4::timestamptz, $5, $6, $7::jsonb)
            ON CONFLICT (symbol, source, timestamp) DO UPDATE
            SET price = EXCLUDED.price,
                volume = EXCLUDED.volume,
                worker_id = EXCLUDED.worker_id,
                metadata = EXCLUDED.metadata,
                ingested_at = NOW()
        )";
        try {
            pqxx::connection conn(conn_str_);
            pqxx::work txn(conn);
            txn.exec(query, pqxx::params(
                feed.symbol,
                feed.price,
                feed.volume,
                format_iso8601(feed.timestamp),
                feed.source,
                feed.worker_id,
                feed.metadata.is_null() ? std::string("{}") : feed.metadata.dump()));
            txn.commit();
        } catch (const std::exception& e) {
            throw StorageError("Failed to upsert price feed: " + std::string(e.what()));
        }
    }

    std::vector<PriceFeed> feeds_between(const std::string& symbol,
                                         Timestamp from, Timestamp to) const override {
        static const std::string query = R"(
            SELECT symbol, price::text, volume::text,
                   (EXTRACT(EPOCH FROM timestamp) * 1000)::bigint,
                   source, worker_id, metadata::text
            FROM price_feeds
            WHERE symbol = $1
              AND timestamp >= $2::timestamptz
              AND timestamp <= $3::timestamptz
            ORDER BY timestamp ASC
        )";
        try {
            pqxx::connection conn(conn_str_);
            pqxx::read_transaction txn(conn);
            pqxx::result result = txn.exec(query, pqxx::params(
                symbol, format_iso8601(from), format_iso8601(to)));
            std::vector<PriceFeed> feeds;
            feeds.reserve(result.size());
            for (const auto& row : result) feeds.push_back(feed_from_row(row));
            return feeds;
        } catch (const std::exception& e) {
            throw StorageError("Failed to read price feeds for " + symbol + ": " + e.what());
        }
    }

    std::optional<PriceFeed> latest_feed(const std::string& symbol) const override {
        static const std::string query = R"(
            SELECT symbol, price::text, volume::text,
                   (EXTRACT(EPOCH FROM timestamp) * 1000)::bigint,
                   source, worker_id, metadata::text
            FROM price_feeds
            WHERE symbol = $1
            ORDER BY timestamp DESC
            LIMIT 1
        )";
        try {
            pqxx::connection conn(conn_str_);
            pqxx::read_transaction txn(conn);
            pqxx::result result = txn.exec(query, pqxx::params(symbol));
            if (result.empty()) return std::nullopt;
            return feed_from_row(result[0]);
        } catch (const std::exception& e) {
            throw StorageError("Failed to read latest feed for " + symbol + ": " + e.what());
        }
    }

    void insert_consensus(const ConsensusRecord& rec) override {
        static const std::string query = R"(
            INSERT INTO consensus_prices (symbol, price, median, mean, std_dev, num_sources, sources, timestamp)
            VALUES ($1, $2::numeric, $3::numeric, $4::numeric, $5::numeric, $6, $7::jsonb, $8::timestamptz)
            ON CONFLICT (symbol, timestamp) DO UPDATE
            SET price = EXCLUDED.price,
                median = EXCLUDED.median,
                mean = EXCLUDED.mean,
                std_dev = EXCLUDED.std_dev,
                num_sources = EXCLUDED.num_sources,
                sources = EXCLUDED.sources
        )";
        try {
            pqxx::connection conn(conn_str_);
            pqxx::work txn(conn);
            txn.exec(query, pqxx::params(
                rec.symbol,
                rec.price,
                rec.median,
                rec.mean,
                rec.std_dev,
                static_cast<int>(rec.num_sources),
                nlohmann::json(rec.sources).dump(),
                format_iso8601(rec.timestamp)));
            txn.commit();
        } catch (const std::exception& e) {
            throw StorageError("Failed to insert consensus for " + rec.symbol + ": " + e.what());
        }
    }

    std::optional<ConsensusRecord> latest_consensus(const std::string& symbol) const override {
        static const std::string query = R"(
            SELECT symbol, price::text, median::text, mean::text, std_dev::text, num_sources,
                   sources::text, (EXTRACT(EPOCH FROM timestamp) * 1000)::bigint
            FROM consensus_prices
            WHERE symbol = $1
            ORDER BY timestamp DESC
            LIMIT 1
        )";
        try {
            pqxx::connection conn(conn_str_);
            pqxx::read_transaction txn(conn);
            pqxx::result result = txn.exec(query, pqxx::params(symbol));
            if (result.empty()) return std::nullopt;

            auto row = result[0];
            ConsensusRecord rec;
            rec.symbol = row[0].as<std::string>();
            rec.price = row[1].as<std::string>();
            rec.median = row[2].as<std::string>();
            rec.mean = row[3].as<std::string>();
            if (!row[4].is_null()) rec.std_dev = row[4].as<std::string>();
            rec.num_sources = static_cast<std::size_t>(row[5].as<int>());
            for (const auto& s : nlohmann::json::parse(row[6].as<std::string>())) {
                rec.sources.insert(s.get<std::string>());
            }
            rec.timestamp = ts_from_ms(row[7].as<std::int64_t>());
            return rec;
        } catch (const std::exception& e) {
            throw StorageError("Failed to read consensus for " + symbol + ": " + e.what());
        }
    }

    std::size_t feed_count() const override {
        try {
            pqxx::connection conn(conn_str_);
            pqxx::read_transaction txn(conn);
            pqxx::result result = txn.exec("SELECT COUNT(*) FROM price_feeds");
            return result[0][0].as<std::size_t>();
        } catch (const std::exception& e) {
            throw StorageError("Failed to count price feeds: " + std::string(e.what()));
        }
    }

    std::vector<std::string> symbols() const override {
        try {
            pqxx::connection conn(conn_str_);
            pqxx::read_transaction txn(conn);
            pqxx::result result = txn.exec("SELECT DISTINCT symbol FROM price_feeds ORDER BY symbol");
            std::vector<std::string> out;
            out.reserve(result.size());
            for (const auto& row : result) out.push_back(row[0].as<std::string>());
            return out;
        } catch (const std::exception& e) {
            throw StorageError("Failed to list symbols: " + std::string(e.what()));
        }
    }

    const char* kind() const override { return "postgres"; }

private:
    std::string conn_str_;

    static std::string with_connect_timeout(std::string conn) {
        if (conn.find("connect_timeout") == std::string::npos) {
            conn += (conn.find('?') != std::string::npos) ? "&connect_timeout=10" : "?connect_timeout=10";
        }
        return conn;
    }

    static PriceFeed feed_from_row(const pqxx::row& row) {
        PriceFeed f;
        f.symbol = row[0].as<std::string>();
        f.price = row[1].as<std::string>();
        if (!row[2].is_null()) f.volume = row[2].as<std::string>();
        f.timestamp = ts_from_ms(row[3].as<std::int64_t>());
        f.source = row[4].as<std::string>();
        f.worker_id = row[5].is_null() ? std::string() : row[5].as<std::string>();
        if (!row[6].is_null()) f.metadata = nlohmann::json::parse(row[6].as<std::string>());
        return f;
    }

    static std::string read_sql_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw StorageError("Failed to open SQL file: " + filepath);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    void ensure_schema(pqxx::connection& conn, const std::string& schema_path) {
        std::string sql;
        try {
            sql = read_sql_file(schema_path);
        } catch (const StorageError& e1) {
            // Running from the repository root instead of backend/
            try {
                sql = read_sql_file("backend/" + schema_path);
            } catch (const StorageError& e2) {
                throw StorageError(std::string(e1.what()) + " / " + e2.what());
            }
        }

        // Use nontransaction for DDL statements (CREATE TABLE, etc.)
        pqxx::nontransaction ntxn(conn);

        // Split SQL by semicolon and execute each statement
        std::istringstream stream(sql);
        std::string statement;
        std::string line;
        while (std::getline(stream, line)) {
            std::string trimmed = line;
            trimmed.erase(0, trimmed.find_first_not_of(" \t"));
            if (trimmed.empty() || trimmed.rfind("--", 0) == 0) {
                continue;
            }

            statement += line + "\n";
            if (line.find(';') == std::string::npos) continue;

            try {
                ntxn.exec(statement);
            } catch (const pqxx::sql_error& e) {
                std::string err_msg = e.what();
                if (err_msg.find("already exists") == std::string::npos) {
                    throw StorageError("Schema statement failed: " + err_msg);
                }
            }
            statement.clear();
        }
    }
};

std::unique_ptr<IFeedStore> make_pg_feed_store(const std::string& connection_string,
                                               const std::string& schema_path) {
    return std::make_unique<PgFeedStore>(connection_string, schema_path);
}
