#pragma once

/**
 * Time utilities
 *
 * Epoch-millisecond timestamps and America/New_York civil time. The exchange
 * calendar only needs New York local time, so the US daylight-saving rule
 * (second Sunday of March 02:00 to first Sunday of November 02:00, local) is
 * applied directly instead of consulting a tz database.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace zonetrader {
namespace util {

using Date = std::chrono::year_month_day;

/**
 * Current wall-clock time in milliseconds since Unix epoch.
 */
inline Timestamp now_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

inline Date make_date(int year, unsigned month, unsigned day) {
    return Date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

inline Date add_days(const Date& date, int days) {
    return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

// 0 = Sunday ... 6 = Saturday
inline unsigned weekday_of(const Date& date) {
    return std::chrono::weekday{std::chrono::sys_days{date}}.c_encoding();
}

// nth (1-based) occurrence of a weekday in a month
inline Date nth_weekday_of_month(int year, unsigned month, unsigned weekday, unsigned n) {
    Date first = make_date(year, month, 1);
    unsigned first_wd = weekday_of(first);
    unsigned offset = (weekday + 7 - first_wd) % 7;
    return add_days(first, static_cast<int>(offset + (n - 1) * 7));
}

inline Date last_weekday_of_month(int year, unsigned month, unsigned weekday) {
    Date last = Date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::last};
    unsigned last_wd = weekday_of(last);
    unsigned back = (last_wd + 7 - weekday) % 7;
    return add_days(last, -static_cast<int>(back));
}

/**
 * Parse an ISO local date (YYYY-MM-DD). Returns nullopt on anything else.
 */
inline std::optional<Date> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;
    auto digits = [&](size_t pos, size_t len, int& out) {
        out = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (text[i] < '0' || text[i] > '9')
                return false;
            out = out * 10 + (text[i] - '0');
        }
        return true;
    };
    int y, m, d;
    if (!digits(0, 4, y) || !digits(5, 2, m) || !digits(8, 2, d))
        return std::nullopt;
    Date date = make_date(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
    if (!date.ok())
        return std::nullopt;
    return date;
}

inline std::string format_date(const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
    return buf;
}

inline Timestamp days_to_ms(const Date& date) {
    return static_cast<Timestamp>(std::chrono::sys_days{date}.time_since_epoch().count()) * MS_PER_DAY;
}

/**
 * Parse a UTC instant such as 2024-03-15T13:30:05.250Z into epoch ms.
 * Fractional seconds are optional; a missing zone designator is read as UTC.
 */
inline std::optional<Timestamp> parse_utc_timestamp(std::string_view text) {
    if (text.size() < 19 || text[10] != 'T' || text[13] != ':' || text[16] != ':')
        return std::nullopt;
    auto date = parse_date(text.substr(0, 10));
    if (!date)
        return std::nullopt;
    auto two = [&](size_t pos) -> int {
        char a = text[pos], b = text[pos + 1];
        if (a < '0' || a > '9' || b < '0' || b > '9')
            return -1;
        return (a - '0') * 10 + (b - '0');
    };
    int hour = two(11), minute = two(14), second = two(17);
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60)
        return std::nullopt;

    Timestamp millis = 0;
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        Timestamp scale = 100;
        for (++pos; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
        }
    }
    return days_to_ms(*date) + hour * MS_PER_HOUR + minute * MS_PER_MINUTE + second * MS_PER_SECOND + millis;
}

/**
 * True when the New York local wall time (date, minute of day) is in DST.
 */
inline bool is_new_york_dst(const Date& date, int minute_of_day) {
    int year = static_cast<int>(date.year());
    Date dst_start = nth_weekday_of_month(year, 3, 0, 2);
    Date dst_end = nth_weekday_of_month(year, 11, 0, 1);
    auto day = std::chrono::sys_days{date};
    if (day < std::chrono::sys_days{dst_start} || day > std::chrono::sys_days{dst_end})
        return false;
    if (day == std::chrono::sys_days{dst_start})
        return minute_of_day >= 2 * 60;
    if (day == std::chrono::sys_days{dst_end})
        return minute_of_day < 2 * 60;
    return true;
}

// UTC offset of New York local wall time in ms (negative)
inline Timestamp new_york_offset_ms(const Date& date, int minute_of_day = 0) {
    return is_new_york_dst(date, minute_of_day) ? -4 * MS_PER_HOUR : -5 * MS_PER_HOUR;
}

/**
 * Epoch ms for New York local wall time on the given date.
 */
inline Timestamp new_york_time(const Date& date, int hour, int minute = 0) {
    int minute_of_day = hour * 60 + minute;
    Timestamp local_ms = days_to_ms(date) + static_cast<Timestamp>(minute_of_day) * MS_PER_MINUTE;
    return local_ms - new_york_offset_ms(date, minute_of_day);
}

inline Timestamp new_york_midnight(const Date& date) { return new_york_time(date, 0, 0); }

namespace detail {
inline Timestamp floor_days(Timestamp ms) {
    Timestamp days = ms / MS_PER_DAY;
    if (ms % MS_PER_DAY < 0)
        --days;
    return days;
}
} // namespace detail

/**
 * UTC offset in effect in New York at an instant. DST starts at 07:00 UTC
 * on the second Sunday of March and ends at 06:00 UTC on the first Sunday
 * of November.
 */
inline Timestamp new_york_offset_at(Timestamp ts) {
    Date approx = Date{std::chrono::sys_days{std::chrono::days{detail::floor_days(ts - 5 * MS_PER_HOUR)}}};
    int year = static_cast<int>(approx.year());
    Timestamp dst_start = days_to_ms(nth_weekday_of_month(year, 3, 0, 2)) + 7 * MS_PER_HOUR;
    Timestamp dst_end = days_to_ms(nth_weekday_of_month(year, 11, 0, 1)) + 6 * MS_PER_HOUR;
    return (ts >= dst_start && ts < dst_end) ? -4 * MS_PER_HOUR : -5 * MS_PER_HOUR;
}

inline Timestamp to_new_york_local_ms(Timestamp ts) { return ts + new_york_offset_at(ts); }

/**
 * New York calendar date of an epoch-ms timestamp.
 */
inline Date to_new_york_date(Timestamp ts) {
    return Date{std::chrono::sys_days{std::chrono::days{detail::floor_days(to_new_york_local_ms(ts))}}};
}

/**
 * Minutes since New York local midnight (wall clock) for an epoch-ms timestamp.
 */
inline int new_york_minute_of_day(Timestamp ts) {
    Timestamp local = to_new_york_local_ms(ts);
    return static_cast<int>((local - detail::floor_days(local) * MS_PER_DAY) / MS_PER_MINUTE);
}

inline int new_york_hour(Timestamp ts) { return new_york_minute_of_day(ts) / 60; }

inline bool is_in_new_york_date(const Date& date, Timestamp ts) { return to_new_york_date(ts) == date; }

/**
 * ISO-8601 New York local time with offset, e.g. 2024-03-15T09:30:00-04:00
 */
inline std::string to_new_york_time_string(Timestamp ts) {
    Timestamp local = to_new_york_local_ms(ts);
    Timestamp in_day = local - detail::floor_days(local) * MS_PER_DAY;
    int minute_of_day = static_cast<int>(in_day / MS_PER_MINUTE);
    int second = static_cast<int>((in_day / MS_PER_SECOND) % 60);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02d%+03d:00", format_date(to_new_york_date(ts)).c_str(),
                  minute_of_day / 60, minute_of_day % 60, second,
                  static_cast<int>(new_york_offset_at(ts) / MS_PER_HOUR));
    return buf;
}

} // namespace util
} // namespace zonetrader
