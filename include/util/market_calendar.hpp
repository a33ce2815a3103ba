#pragma once

/**
 * US equity-index futures calendar
 *
 * Trading days skip weekends and NYSE holidays (observed dates when the
 * holiday falls on a weekend). All session times are America/New_York.
 */

#include "time_utils.hpp"

#include <array>
#include <vector>

namespace zonetrader {
namespace util {

// Weekend holidays are observed on the adjacent weekday
inline Date observed_holiday(const Date& date) {
    switch (weekday_of(date)) {
    case 6:
        return add_days(date, -1); // Saturday -> Friday
    case 0:
        return add_days(date, 1); // Sunday -> Monday
    default:
        return date;
    }
}

// A Saturday New Year's Day is not observed on the Friday before
inline Date new_years_holiday(int year) {
    Date date = make_date(year, 1, 1);
    return weekday_of(date) == 6 ? date : observed_holiday(date);
}

/**
 * Good Friday via the anonymous Gregorian Easter computus.
 */
inline Date good_friday(int year) {
    int a = year % 19;
    int b = year / 100;
    int c = year % 100;
    int d = b / 4;
    int e = b % 4;
    int f = (b + 8) / 25;
    int g = (b - f + 1) / 3;
    int h = (19 * a + b - d - g + 15) % 30;
    int i = c / 4;
    int k = c % 4;
    int l = (32 + 2 * e + 2 * i - h - k) % 7;
    int m = (a + 11 * h + 22 * l) / 451;
    int month = (h + l - 7 * m + 114) / 31;
    int day = ((h + l - 7 * m + 114) % 31) + 1;
    return add_days(make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day)), -2);
}

class MarketCalendar {
public:
    static bool is_weekend(const Date& date) {
        unsigned wd = weekday_of(date);
        return wd == 0 || wd == 6;
    }

    static std::array<Date, 10> holidays(int year) {
        return {
            new_years_holiday(year),                   // New Year's Day
            nth_weekday_of_month(year, 1, 1, 3),       // MLK Day
            nth_weekday_of_month(year, 2, 1, 3),       // Presidents Day
            good_friday(year),                         // Good Friday
            last_weekday_of_month(year, 5, 1),         // Memorial Day
            observed_holiday(make_date(year, 6, 19)),  // Juneteenth
            observed_holiday(make_date(year, 7, 4)),   // Independence Day
            nth_weekday_of_month(year, 9, 1, 1),       // Labor Day
            nth_weekday_of_month(year, 11, 4, 4),      // Thanksgiving
            observed_holiday(make_date(year, 12, 25)), // Christmas
        };
    }

    static bool is_market_holiday(const Date& date) {
        for (const Date& holiday : holidays(static_cast<int>(date.year()))) {
            if (holiday == date)
                return true;
        }
        return false;
    }

    static bool is_trading_day(const Date& date) { return !is_weekend(date) && !is_market_holiday(date); }

    // 13:00 close on the weekday before Independence Day, Thanksgiving and Christmas
    static bool is_early_close_day(const Date& date) {
        if (is_weekend(date))
            return false;
        int year = static_cast<int>(date.year());
        return date == add_days(make_date(year, 7, 4), -1) ||
               date == add_days(nth_weekday_of_month(year, 11, 4, 4), -1) ||
               date == add_days(make_date(year, 12, 25), -1);
    }

    /**
     * The date `trading_days` trading days before `date` (exclusive of date).
     */
    static Date trading_days_back(const Date& date, int trading_days) {
        Date current = add_days(date, -1);
        int count = 0;
        while (true) {
            if (is_trading_day(current)) {
                ++count;
                if (count >= trading_days)
                    return current;
            }
            current = add_days(current, -1);
        }
    }

    /**
     * The `count` trading days preceding `date`, oldest first.
     */
    static std::vector<Date> prior_trading_days(const Date& date, int count) {
        std::vector<Date> days;
        Date current = add_days(date, -1);
        while (static_cast<int>(days.size()) < count) {
            if (is_trading_day(current))
                days.insert(days.begin(), current);
            current = add_days(current, -1);
        }
        return days;
    }
};

// ============================================================================
// Session times (America/New_York)
// ============================================================================

inline Timestamp new_york_open(const Date& date) { return new_york_time(date, 9, 30); }
inline Timestamp new_york_close(const Date& date) { return new_york_time(date, 16, 0); }

inline bool is_in_market_open(const Date& date, Timestamp ts) {
    return new_york_open(date) <= ts && ts <= new_york_close(date);
}

// Within two minutes of the 16:00 close
inline bool is_near_trading_close(Timestamp ts) {
    return ts >= new_york_close(to_new_york_date(ts)) - 2 * MS_PER_MINUTE;
}

// Within ten minutes of the 16:00 close
inline bool is_end_of_day(Timestamp ts) { return ts >= new_york_close(to_new_york_date(ts)) - 10 * MS_PER_MINUTE; }

// Blackout window [start_hour, end_hour) New York local
inline bool is_in_blackout(Timestamp ts, int start_hour = 10, int end_hour = 12) {
    int hour = new_york_hour(ts);
    return hour >= start_hour && hour < end_hour;
}

inline Date next_trading_day(const Date& date) {
    Date current = add_days(date, 1);
    while (!MarketCalendar::is_trading_day(current))
        current = add_days(current, 1);
    return current;
}

// Futures sessions open at 18:00 New York; evening candles belong to the next trading day
inline Date trading_day_of(Timestamp ts) {
    Date date = to_new_york_date(ts);
    if (new_york_minute_of_day(ts) >= 18 * 60 || !MarketCalendar::is_trading_day(date))
        return next_trading_day(date);
    return date;
}

/**
 * Market session whose high/low extremes are tracked as liquidity.
 */
enum class Market : uint8_t { NewYork = 0, Asia = 1, London = 2 };

inline const char* market_to_string(Market market) {
    switch (market) {
    case Market::NewYork:
        return "NewYork";
    case Market::Asia:
        return "Asia";
    case Market::London:
        return "London";
    default:
        return "Unknown";
    }
}

struct SessionWindow {
    Market market;
    Timestamp start; // inclusive
    Timestamp end;   // inclusive

    bool contains(Timestamp ts) const { return start <= ts && ts <= end; }
};

inline SessionWindow new_york_window(const Date& date) {
    return SessionWindow{Market::NewYork, new_york_open(date), new_york_close(date)};
}

/**
 * Session windows for a trading day:
 *   NewYork: prior trading day 09:30-16:00
 *   Asia:    prior calendar day 18:00 to trading day 02:00
 *   London:  trading day 03:00-09:30
 */
inline std::array<SessionWindow, 3> session_windows(const Date& trading_day) {
    Date prior_trading = MarketCalendar::trading_days_back(trading_day, 1);
    Date prior_day = add_days(trading_day, -1);
    return {
        new_york_window(prior_trading),
        SessionWindow{Market::Asia, new_york_time(prior_day, 18, 0), new_york_time(trading_day, 2, 0)},
        SessionWindow{Market::London, new_york_time(trading_day, 3, 0), new_york_time(trading_day, 9, 30)},
    };
}

} // namespace util
} // namespace zonetrader
