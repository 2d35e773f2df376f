#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Wall-clock instant with millisecond resolution, the unit every exchange reports.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp now_ts();
Timestamp ts_from_ms(std::int64_t epoch_ms);
std::int64_t ts_to_ms(Timestamp t);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff...](Z|+HH:MM|-HH:MM)".
// Fractions beyond milliseconds are truncated.
std::optional<Timestamp> parse_iso8601(std::string_view text);

// Always "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601(Timestamp t);
