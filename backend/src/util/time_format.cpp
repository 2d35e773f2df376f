#include "util/time_format.hpp"

#include <cctype>
#include <cstdio>

namespace
{
    // Howard Hinnant's civil calendar conversions.
    std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
    {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    void civil_from_days(std::int64_t z, std::int64_t &y, unsigned &m, unsigned &d)
    {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        y = static_cast<std::int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y += m <= 2;
    }

    bool read_fixed(std::string_view s, std::size_t pos, std::size_t len, int &out)
    {
        if (pos + len > s.size()) return false;
        int v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
            v = v * 10 + (s[i] - '0');
        }
        out = v;
        return true;
    }
}

Timestamp now_ts()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

Timestamp ts_from_ms(std::int64_t epoch_ms)
{
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

std::int64_t ts_to_ms(Timestamp t)
{
    return t.time_since_epoch().count();
}

std::optional<Timestamp> parse_iso8601(std::string_view s)
{
    int year, month, day, hour, minute, second;
    if (!read_fixed(s, 0, 4, year) || s.size() < 19 || s[4] != '-' ||
        !read_fixed(s, 5, 2, month) || s[7] != '-' ||
        !read_fixed(s, 8, 2, day) || (s[10] != 'T' && s[10] != 't' && s[10] != ' ') ||
        !read_fixed(s, 11, 2, hour) || s[13] != ':' ||
        !read_fixed(s, 14, 2, minute) || s[16] != ':' ||
        !read_fixed(s, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (std::size_t i = digits; i < 3; ++i) millis *= 10;
    }

    std::int64_t offset_min = 0;
    if (pos >= s.size()) return std::nullopt;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        const int sign = s[pos] == '-' ? -1 : 1;
        int oh, om;
        if (!read_fixed(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !read_fixed(s, pos + 4, 2, om)) {
            return std::nullopt;
        }
        offset_min = sign * (oh * 60 + om);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_min * 60;
    return ts_from_ms(secs * 1000 + millis);
}

std::string format_iso8601(Timestamp t)
{
    const std::int64_t ms_total = ts_to_ms(t);
    std::int64_t secs = ms_total / 1000;
    std::int64_t ms = ms_total % 1000;
    if (ms < 0) { ms += 1000; secs -= 1; }
    std::int64_t days = secs / 86400;
    std::int64_t rem = secs % 86400;
    if (rem < 0) { rem += 86400; days -= 1; }

    std::int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60),
                  static_cast<long long>(rem % 60),
                  static_cast<long long>(ms));
    return buf;
}
