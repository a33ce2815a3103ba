#include <cassert>
#include <iostream>
#include "../include/util/market_calendar.hpp"
#include "../include/util/time_utils.hpp"

using namespace zonetrader;
using namespace zonetrader::util;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

// 2024-03-14 13:30 UTC = 09:30 New York (EDT)
constexpr Timestamp MAR14_OPEN = 1710423000000LL;
// 2024-01-16 14:30 UTC = 09:30 New York (EST)
constexpr Timestamp JAN16_OPEN = 1705415400000LL;

// ============================================================================
// Dates
// ============================================================================

TEST(test_parse_and_format_date) {
    auto date = parse_date("2024-03-14");
    ASSERT_TRUE(date.has_value());
    ASSERT_EQ(*date, make_date(2024, 3, 14));
    ASSERT_EQ(format_date(*date), "2024-03-14");
}

TEST(test_parse_date_rejects_garbage) {
    ASSERT_FALSE(parse_date("2024-3-14").has_value());
    ASSERT_FALSE(parse_date("2024/03/14").has_value());
    ASSERT_FALSE(parse_date("2024-02-30").has_value());
    ASSERT_FALSE(parse_date("").has_value());
    ASSERT_FALSE(parse_date("abcd-ef-gh").has_value());
}

TEST(test_parse_utc_timestamp) {
    auto ts = parse_utc_timestamp("2024-03-14T13:30:00.250Z");
    ASSERT_TRUE(ts.has_value());
    ASSERT_EQ(*ts, MAR14_OPEN + 250);
    ASSERT_FALSE(parse_utc_timestamp("2024-03-14 13:30").has_value());
}

// ============================================================================
// New York time
// ============================================================================

TEST(test_new_york_open_respects_dst) {
    ASSERT_EQ(new_york_open(make_date(2024, 3, 14)), MAR14_OPEN);
    ASSERT_EQ(new_york_open(make_date(2024, 1, 16)), JAN16_OPEN);
    ASSERT_EQ(new_york_close(make_date(2024, 3, 14)) - MAR14_OPEN, 390 * MS_PER_MINUTE);
}

TEST(test_to_new_york_date_and_minute) {
    ASSERT_EQ(to_new_york_date(MAR14_OPEN), make_date(2024, 3, 14));
    ASSERT_EQ(new_york_minute_of_day(MAR14_OPEN), 9 * 60 + 30);
    // 02:00 UTC on the 15th is still the 14th in New York
    ASSERT_EQ(to_new_york_date(MAR14_OPEN + 12 * MS_PER_HOUR + 30 * MS_PER_MINUTE), make_date(2024, 3, 14));
}

TEST(test_time_string) {
    ASSERT_EQ(to_new_york_time_string(MAR14_OPEN), "2024-03-14T09:30:00-04:00");
    ASSERT_EQ(to_new_york_time_string(JAN16_OPEN), "2024-01-16T09:30:00-05:00");
}

// ============================================================================
// Calendar
// ============================================================================

TEST(test_holidays_and_weekends) {
    ASSERT_TRUE(MarketCalendar::is_trading_day(make_date(2024, 3, 14)));
    ASSERT_FALSE(MarketCalendar::is_trading_day(make_date(2024, 3, 16)));  // Saturday
    ASSERT_FALSE(MarketCalendar::is_trading_day(make_date(2024, 3, 29)));  // Good Friday
    ASSERT_FALSE(MarketCalendar::is_trading_day(make_date(2024, 7, 4)));   // Independence Day
    ASSERT_FALSE(MarketCalendar::is_trading_day(make_date(2024, 1, 15)));  // MLK Day
    ASSERT_FALSE(MarketCalendar::is_trading_day(make_date(2021, 12, 24))); // Christmas observed on Friday
    ASSERT_TRUE(MarketCalendar::is_trading_day(make_date(2021, 12, 31)));  // Saturday New Year not observed
    ASSERT_TRUE(MarketCalendar::is_early_close_day(make_date(2024, 7, 3)));
}

TEST(test_trading_days_back_skips_weekend) {
    // Monday 2024-03-18: one back is Friday the 15th, two back is Thursday the 14th
    ASSERT_EQ(MarketCalendar::trading_days_back(make_date(2024, 3, 18), 1), make_date(2024, 3, 15));
    ASSERT_EQ(MarketCalendar::trading_days_back(make_date(2024, 3, 18), 2), make_date(2024, 3, 14));

    auto prior = MarketCalendar::prior_trading_days(make_date(2024, 3, 18), 2);
    ASSERT_EQ(prior.size(), 2u);
    ASSERT_EQ(prior[0], make_date(2024, 3, 14));
    ASSERT_EQ(prior[1], make_date(2024, 3, 15));
}

TEST(test_trading_day_rolls_at_six_pm) {
    // Thursday 17:59 belongs to Thursday, 18:00 to Friday
    Timestamp thu_1759 = new_york_time(make_date(2024, 3, 14), 17, 59);
    ASSERT_EQ(trading_day_of(thu_1759), make_date(2024, 3, 14));
    ASSERT_EQ(trading_day_of(thu_1759 + MS_PER_MINUTE), make_date(2024, 3, 15));
    // Friday evening and Sunday evening both belong to Monday
    ASSERT_EQ(trading_day_of(new_york_time(make_date(2024, 3, 15), 19, 0)), make_date(2024, 3, 18));
    ASSERT_EQ(trading_day_of(new_york_time(make_date(2024, 3, 17), 18, 0)), make_date(2024, 3, 18));
}

TEST(test_session_windows) {
    auto windows = session_windows(make_date(2024, 3, 18));
    ASSERT_EQ(windows[0].market, Market::NewYork);
    ASSERT_EQ(windows[0].start, new_york_open(make_date(2024, 3, 15)));
    ASSERT_EQ(windows[1].market, Market::Asia);
    ASSERT_EQ(windows[1].start, new_york_time(make_date(2024, 3, 17), 18, 0));
    ASSERT_EQ(windows[2].market, Market::London);
    ASSERT_EQ(windows[2].end, new_york_open(make_date(2024, 3, 18)));
    ASSERT_TRUE(windows[2].contains(new_york_time(make_date(2024, 3, 18), 4, 0)));
}

TEST(test_session_predicates) {
    Date day = make_date(2024, 3, 14);
    ASSERT_TRUE(is_in_blackout(new_york_time(day, 10, 0)));
    ASSERT_FALSE(is_in_blackout(new_york_time(day, 12, 0)));
    ASSERT_TRUE(is_near_trading_close(new_york_time(day, 15, 58)));
    ASSERT_FALSE(is_near_trading_close(new_york_time(day, 15, 57)));
    ASSERT_TRUE(is_end_of_day(new_york_time(day, 15, 50)));
    ASSERT_FALSE(is_end_of_day(new_york_time(day, 15, 49)));
}

int main() {
    std::cout << "\n=== Time and Calendar Tests ===\n\n";

    RUN_TEST(test_parse_and_format_date);
    RUN_TEST(test_parse_date_rejects_garbage);
    RUN_TEST(test_parse_utc_timestamp);
    RUN_TEST(test_new_york_open_respects_dst);
    RUN_TEST(test_to_new_york_date_and_minute);
    RUN_TEST(test_time_string);
    RUN_TEST(test_holidays_and_weekends);
    RUN_TEST(test_trading_days_back_skips_weekend);
    RUN_TEST(test_trading_day_rolls_at_six_pm);
    RUN_TEST(test_session_windows);
    RUN_TEST(test_session_predicates);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
