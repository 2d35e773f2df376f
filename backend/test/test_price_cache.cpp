#include "cache/broadcaster.hpp"
#include "cache/price_cache.hpp"
#include "util/logging.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <thread>

namespace
{
    ConsensusRecord record(const std::string &symbol, const std::string &price, Timestamp ts)
    {
        ConsensusRecord r;
        r.symbol = symbol;
        r.price = r.median = r.mean = price;
        r.num_sources = 1;
        r.sources = {"coinbase"};
        r.timestamp = ts;
        return r;
    }
}

TEST(PriceBroadcaster, EverySubscriberGetsEveryRecordInOrder)
{
    PriceBroadcaster b(64, make_silent_logger());
    auto s1 = b.subscribe();
    auto s2 = b.subscribe();
    EXPECT_EQ(b.subscriber_count(), 2u);

    for (int i = 0; i < 10; ++i) b.publish(record("BTC/USD", std::to_string(i), ts_from_ms(i)));

    for (auto *sub : {s1.get(), s2.get()}) {
        const auto got = sub->drain();
        ASSERT_EQ(got.size(), 10u);
        for (int i = 0; i < 10; ++i) EXPECT_EQ(got[i].consensus.price, std::to_string(i));
        EXPECT_TRUE(sub->drain().empty()); // exactly once
    }
}

TEST(PriceBroadcaster, SlowSubscriberIsDisconnected)
{
    PriceBroadcaster b(64, make_silent_logger());
    auto slow = b.subscribe(3);
    auto fast = b.subscribe();

    for (int i = 0; i < 5; ++i) b.publish(record("BTC/USD", std::to_string(i), ts_from_ms(i)));

    EXPECT_TRUE(slow->closed());
    EXPECT_TRUE(slow->overflowed());
    EXPECT_TRUE(slow->drain().empty());
    EXPECT_EQ(b.disconnected_slow(), 1u);
    EXPECT_EQ(b.subscriber_count(), 1u);
    EXPECT_EQ(fast->drain().size(), 5u);
}

TEST(PriceBroadcaster, CancelReleasesQueueAndIsNotASlowDisconnect)
{
    PriceBroadcaster b(8, make_silent_logger());
    auto sub = b.subscribe();
    b.publish(record("BTC/USD", "1", ts_from_ms(1)));

    sub->cancel();
    EXPECT_TRUE(sub->closed());
    EXPECT_FALSE(sub->overflowed());
    StreamEvent out;
    EXPECT_FALSE(sub->try_pop(out));

    b.publish(record("BTC/USD", "2", ts_from_ms(2)));
    EXPECT_EQ(b.subscriber_count(), 0u);
    EXPECT_EQ(b.disconnected_slow(), 0u);
}

TEST(PriceBroadcaster, UnsubscribeClosesImmediately)
{
    PriceBroadcaster b(8, make_silent_logger());
    auto sub = b.subscribe();
    b.unsubscribe(sub->id());
    EXPECT_TRUE(sub->closed());
    EXPECT_EQ(b.subscriber_count(), 0u);
    b.unsubscribe(sub->id()); // unknown id is a no-op
}

TEST(PriceBroadcaster, WaitPopWakesOnPublish)
{
    PriceBroadcaster b(8, make_silent_logger());
    auto sub = b.subscribe();
    std::thread publisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        b.publish(record("ETH/USD", "2500", ts_from_ms(1)));
    });
    auto got = sub->wait_pop(std::chrono::seconds(2));
    publisher.join();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->symbol(), "ETH/USD");

    EXPECT_FALSE(sub->wait_pop(std::chrono::milliseconds(5)).has_value());
}

TEST(PublishedPriceCache, PublishReplacesAndBroadcasts)
{
    auto b = std::make_shared<PriceBroadcaster>(8, make_silent_logger());
    PublishedPriceCache cache(b, make_silent_logger());
    auto sub = b->subscribe();

    cache.publish(record("BTC/USD", "100", ts_from_ms(1000)));
    cache.publish(record("BTC/USD", "101", ts_from_ms(2000)));

    auto c = cache.consensus("BTC/USD", ts_from_ms(2500));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->record.price, "101");
    EXPECT_EQ(c->staleness_ms, 500);
    EXPECT_EQ(sub->drain().size(), 2u);
    EXPECT_FALSE(cache.consensus("ETH/USD").has_value());
}

TEST(PublishedPriceCache, NewerFeedPerSourceWins)
{
    PublishedPriceCache cache(nullptr, make_silent_logger());
    cache.update_feed(make_test_feed("BTC/USD", "100", "coinbase", ts_from_ms(2000)));
    cache.update_feed(make_test_feed("BTC/USD", "99", "coinbase", ts_from_ms(1000))); // older, ignored
    cache.update_feed(make_test_feed("BTC/USD", "101", "kraken", ts_from_ms(1500)));

    const auto feeds = cache.latest_feeds("BTC/USD", ts_from_ms(3000));
    ASSERT_EQ(feeds.size(), 2u);
    for (const auto &f : feeds) {
        if (f.feed.source == "coinbase") {
            EXPECT_EQ(f.feed.price, "100");
            EXPECT_EQ(f.staleness_ms, 1000);
        } else {
            EXPECT_EQ(f.feed.price, "101");
            EXPECT_EQ(f.staleness_ms, 1500);
        }
    }
    EXPECT_EQ(cache.symbols(), std::vector<std::string>{"BTC/USD"});
}

TEST(PublishedPriceCache, BroadcastFeedReachesSubscribersAsPriceUpdate)
{
    auto b = std::make_shared<PriceBroadcaster>(8, make_silent_logger());
    PublishedPriceCache cache(b, make_silent_logger());
    auto sub = b->subscribe();

    cache.broadcast_feed(make_test_feed("ETH/USD", "2500.5", "kraken", ts_from_ms(1000)));
    cache.publish(record("ETH/USD", "2500.5", ts_from_ms(1000)));

    const auto got = sub->drain();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].kind, StreamEvent::Kind::PriceUpdate);
    EXPECT_EQ(got[0].feed.source, "kraken");
    EXPECT_EQ(got[0].symbol(), "ETH/USD");
    EXPECT_EQ(got[1].kind, StreamEvent::Kind::Consensus);
    EXPECT_EQ(got[1].symbol(), "ETH/USD");
}
