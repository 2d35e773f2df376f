#include "storage/feed_store.hpp"
#include "storage/ohlcv.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace
{
    constexpr std::int64_t kT0 = 1705314600000; // 2024-01-15T10:30:00Z
}

TEST(MemoryFeedStore, UpsertReplacesSameKey)
{
    auto store = make_memory_feed_store();
    store->upsert_feed(make_test_feed("BTC/USD", "100", "coinbase", ts_from_ms(kT0)));
    store->upsert_feed(make_test_feed("BTC/USD", "101", "kraken", ts_from_ms(kT0)));
    store->upsert_feed(make_test_feed("BTC/USD", "102", "coinbase", ts_from_ms(kT0)));
    EXPECT_EQ(store->feed_count(), 2u);

    const auto rows = store->feeds_between("BTC/USD", ts_from_ms(kT0), ts_from_ms(kT0));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].source, "coinbase");
    EXPECT_EQ(rows[0].price, "102");
    EXPECT_EQ(std::string(store->kind()), "memory");
}

TEST(MemoryFeedStore, RangeIsInclusiveAndOrdered)
{
    auto store = make_memory_feed_store();
    for (int i = 0; i < 10; ++i) {
        store->upsert_feed(make_test_feed("ETH/USD", std::to_string(2500 + i), "binance", ts_from_ms(kT0 + i * 1000)));
    }
    store->upsert_feed(make_test_feed("BTC/USD", "1", "binance", ts_from_ms(kT0 + 3000)));

    const auto rows = store->feeds_between("ETH/USD", ts_from_ms(kT0 + 2000), ts_from_ms(kT0 + 5000));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows.front().price, "2502");
    EXPECT_EQ(rows.back().price, "2505");

    EXPECT_TRUE(store->feeds_between("ETH/USD", ts_from_ms(kT0 + 5000), ts_from_ms(kT0)).empty());
    EXPECT_TRUE(store->feeds_between("SOL/USD", ts_from_ms(0), ts_from_ms(kT0 * 2)).empty());

    auto latest = store->latest_feed("ETH/USD");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->price, "2509");
    EXPECT_EQ(store->symbols(), (std::vector<std::string>{"BTC/USD", "ETH/USD"}));
}

TEST(MemoryFeedStore, ConsensusHistoryKeepsLatest)
{
    auto store = make_memory_feed_store();
    EXPECT_FALSE(store->latest_consensus("BTC/USD").has_value());

    ConsensusRecord a;
    a.symbol = "BTC/USD";
    a.price = "100";
    a.timestamp = ts_from_ms(kT0);
    ConsensusRecord b = a;
    b.price = "105";
    b.timestamp = ts_from_ms(kT0 + 5000);
    store->insert_consensus(b);
    store->insert_consensus(a);

    auto latest = store->latest_consensus("BTC/USD");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->price, "105");
}

TEST(Ohlcv, IntervalNames)
{
    EXPECT_EQ(parse_bar_interval("1m")->count(), 60000);
    EXPECT_EQ(parse_bar_interval("4h")->count(), 4 * 3600000);
    EXPECT_EQ(parse_bar_interval("1d")->count(), 86400000);
    EXPECT_FALSE(parse_bar_interval("2m").has_value());
    EXPECT_FALSE(parse_bar_interval("").has_value());
}

TEST(Ohlcv, BucketsFeedsByMinute)
{
    std::vector<PriceFeed> feeds;
    auto add = [&](std::int64_t offset_ms, const char *price, const char *volume) {
        auto f = make_test_feed("BTC/USD", price, "coinbase", ts_from_ms(kT0 + offset_ms));
        if (volume) f.volume = volume;
        feeds.push_back(f);
    };
    add(0, "100.5", "1.25");
    add(10000, "102", nullptr);
    add(20000, "99.75", "0.75");
    add(59999, "101", nullptr);
    add(60000, "103", "2");
    add(125000, "104.10", nullptr);

    const auto bars = build_ohlcv(feeds, std::chrono::minutes(1));
    ASSERT_EQ(bars.size(), 3u);

    EXPECT_EQ(ts_to_ms(bars[0].bucket_start), kT0);
    EXPECT_EQ(bars[0].open, "100.5");
    EXPECT_EQ(bars[0].high, "102");
    EXPECT_EQ(bars[0].low, "99.75");
    EXPECT_EQ(bars[0].close, "101");
    EXPECT_EQ(bars[0].volume, "2");
    EXPECT_EQ(bars[0].num_feeds, 4u);

    EXPECT_EQ(bars[1].open, "103");
    EXPECT_EQ(bars[1].num_feeds, 1u);

    // empty minutes produce no bar
    EXPECT_EQ(ts_to_ms(bars[2].bucket_start), kT0 + 120000);
    EXPECT_EQ(bars[2].close, "104.1");
    EXPECT_EQ(bars[2].volume, "0");
}
