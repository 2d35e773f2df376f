#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "md/price_feed.hpp"

struct OhlcvBar {
    Timestamp bucket_start{};
    std::string open;
    std::string high;
    std::string low;
    std::string close;
    std::string volume;     // sum of reported volumes, "0" when none
    std::size_t num_feeds{0};
};

// "1m", "5m", "15m", "1h", "4h", "1d"; nullopt for anything else.
std::optional<std::chrono::milliseconds> parse_bar_interval(std::string_view text);

// Buckets `feeds` (ascending by timestamp) into bars aligned to the epoch.
// Feeds with unparseable prices are skipped.
std::vector<OhlcvBar> build_ohlcv(const std::vector<PriceFeed> &feeds,
                                  std::chrono::milliseconds interval);
