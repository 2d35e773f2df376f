#include "storage/ohlcv.hpp"
#include "util/decimal.hpp"

#include <array>
#include <utility>

std::optional<std::chrono::milliseconds> parse_bar_interval(std::string_view text)
{
    using namespace std::chrono;
    static const std::array<std::pair<std::string_view, milliseconds>, 6> kIntervals{{
        {"1m", minutes(1)},
        {"5m", minutes(5)},
        {"15m", minutes(15)},
        {"1h", hours(1)},
        {"4h", hours(4)},
        {"1d", hours(24)},
    }};
    for (const auto &kv : kIntervals) {
        if (kv.first == text) return kv.second;
    }
    return std::nullopt;
}

std::vector<OhlcvBar> build_ohlcv(const std::vector<PriceFeed> &feeds,
                                  std::chrono::milliseconds interval)
{
    std::vector<OhlcvBar> bars;
    if (interval.count() <= 0) return bars;

    struct Acc {
        std::int64_t bucket{0};
        Decimal open, high, low, close, volume;
        std::size_t n{0};
    };
    std::optional<Acc> cur;

    auto emit = [&](const Acc &a) {
        OhlcvBar bar;
        bar.bucket_start = ts_from_ms(a.bucket);
        bar.open = a.open.str();
        bar.high = a.high.str();
        bar.low = a.low.str();
        bar.close = a.close.str();
        bar.volume = a.volume.str();
        bar.num_feeds = a.n;
        bars.push_back(std::move(bar));
    };

    for (const auto &f : feeds) {
        auto price = Decimal::parse(f.price);
        if (!price) continue;

        std::int64_t ms = ts_to_ms(f.timestamp);
        std::int64_t bucket = ms - (ms % interval.count());
        if (ms < 0 && ms % interval.count() != 0) bucket -= interval.count();

        if (!cur || cur->bucket != bucket) {
            if (cur) emit(*cur);
            cur = Acc{};
            cur->bucket = bucket;
            cur->open = cur->high = cur->low = *price;
        }
        if (*price > cur->high) cur->high = *price;
        if (*price < cur->low) cur->low = *price;
        cur->close = *price;
        if (f.volume) {
            if (auto v = Decimal::parse(*f.volume)) cur->volume += *v;
        }
        ++cur->n;
    }
    if (cur) emit(*cur);
    return bars;
}
