#include "util/time_format.hpp"

#include <gtest/gtest.h>

TEST(TimeFormat, ParsesUtcWithAndWithoutFraction)
{
    auto t = parse_iso8601("2024-01-15T10:30:00Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(ts_to_ms(*t), 1705314600000);

    auto frac = parse_iso8601("2024-01-15T10:30:00.123Z");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(ts_to_ms(*frac), 1705314600123);

    // Coinbase sends microseconds; the extra digits are truncated
    auto micros = parse_iso8601("2024-01-15T10:30:00.123456Z");
    ASSERT_TRUE(micros.has_value());
    EXPECT_EQ(ts_to_ms(*micros), 1705314600123);

    auto short_frac = parse_iso8601("2024-01-15T10:30:00.5Z");
    ASSERT_TRUE(short_frac.has_value());
    EXPECT_EQ(ts_to_ms(*short_frac), 1705314600500);
}

TEST(TimeFormat, AppliesOffsets)
{
    auto plus = parse_iso8601("2024-01-15T10:30:00+02:00");
    ASSERT_TRUE(plus.has_value());
    EXPECT_EQ(ts_to_ms(*plus), 1705307400000);

    auto minus = parse_iso8601("2024-01-15T06:30:00-02:00");
    ASSERT_TRUE(minus.has_value());
    EXPECT_EQ(ts_to_ms(*minus), 1705314600000 - 2 * 3600 * 1000);
}

TEST(TimeFormat, RejectsMalformedInput)
{
    for (const char *bad : {"", "2024-01-15", "2024-01-15T10:30:00", "2024-13-01T00:00:00Z",
                            "2024-01-15T25:00:00Z", "2024-01-15T10:30:00.Z", "2024/01/15T10:30:00Z",
                            "2024-01-15T10:30:00Zjunk", "not a date"}) {
        EXPECT_FALSE(parse_iso8601(bad).has_value()) << "input: '" << bad << "'";
    }
}

TEST(TimeFormat, FormatsMillisecondUtc)
{
    EXPECT_EQ(format_iso8601(ts_from_ms(1705314600123)), "2024-01-15T10:30:00.123Z");
    EXPECT_EQ(format_iso8601(ts_from_ms(1700000000000)), "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(format_iso8601(ts_from_ms(0)), "1970-01-01T00:00:00.000Z");
}

TEST(TimeFormat, FormatThenParseIsStable)
{
    const auto t = ts_from_ms(1709251199999); // leap-year February
    auto back = parse_iso8601(format_iso8601(t));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, t);
}
