#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include "../include/report/daily_report.hpp"

using namespace zonetrader;
using namespace zonetrader::report;
using order::Order;
using order::OrderStatus;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

const util::Date DAY = util::make_date(2024, 3, 14);
const util::Date NEXT = util::make_date(2024, 3, 15);

// 4 point band: 5 ES contracts, $1000 per R
Order closed(OrderId id, Timestamp created, OrderStatus status, Timestamp closed_at, const std::string& strategy) {
    Order o = Order::from_band(id, created, OrderType::Long, 5000, 5004);
    o.status = status;
    o.entry_strategy = strategy;
    if (status != OrderStatus::Planned)
        o.close_timestamp = closed_at;
    return o;
}

std::vector<Order> sample_day() {
    return {closed(1, 100, OrderStatus::Profit, 3000, "Adaptive-Breakout-Score85-89"),
            closed(2, 200, OrderStatus::Loss, 2000, "Adaptive-MeanReversion-Score75-79"),
            closed(3, 300, OrderStatus::Loss, 4000, "Adaptive-Breakout-Score85-89"),
            closed(4, 400, OrderStatus::Cancelled, 500, "Adaptive-Breakout-Score85-89")};
}

// ============================================================================
// Report math
// ============================================================================

TEST(test_daily_statistics) {
    OrderReport r = build_report(sample_day());
    ASSERT_EQ(r.orders.size(), 4u);
    ASSERT_EQ(r.winning, 1);
    ASSERT_EQ(r.losing, 2);
    ASSERT_EQ(r.cancelled, 1);
    ASSERT_NEAR(r.win_rate(), 1.0 / 3.0, 1e-9);
    ASSERT_NEAR(r.total_r, 0.5, 1e-9);
    ASSERT_NEAR(r.average_win_dollars, 2500.0, 1e-9);
    ASSERT_NEAR(r.average_loss_dollars, 1000.0, 1e-9);
    ASSERT_NEAR(r.total_pnl, 500.0, 1e-9);
    ASSERT_NEAR(r.total_fees, 3 * 5 * 2.88, 1e-9);
    ASSERT_NEAR(r.net_pnl(), 500.0 - 43.2, 1e-9);
    ASSERT_TRUE(r.profitable().has_value());
    ASSERT_TRUE(*r.profitable());
}

TEST(test_drawdown_follows_close_order) {
    // Closes: loss at 2000, win at 3000, loss at 4000
    OrderReport r = build_report(sample_day());
    ASSERT_NEAR(r.max_drawdown_dollars, 1000.0, 1e-9);

    std::vector<Order> streak = {closed(1, 100, OrderStatus::Profit, 1000, "A"),
                                 closed(2, 200, OrderStatus::Loss, 2000, "A"),
                                 closed(3, 300, OrderStatus::Loss, 3000, "A")};
    ASSERT_NEAR(build_report(streak).max_drawdown_dollars, 2000.0, 1e-9);
}

TEST(test_strategy_win_rates_sorted) {
    OrderReport r = build_report(sample_day());
    ASSERT_EQ(r.strategies.size(), 2u);
    ASSERT_EQ(r.strategies[0].entry_strategy, "Adaptive-Breakout-Score85-89");
    ASSERT_EQ(r.strategies[0].trades(), 2);
    ASSERT_NEAR(r.strategies[0].win_rate(), 0.5, 1e-9);
    ASSERT_EQ(r.strategies[1].wins, 0);
}

TEST(test_micro_contract_fees) {
    // 40 point band sizes down to 5 MES
    Order o = Order::from_band(1, 0, OrderType::Short, 5000, 5040);
    ASSERT_EQ(o.contract, "MES");
    ASSERT_EQ(o.contracts, 5);
    ASSERT_NEAR(order_fees(o, ReportConfig{}), 5 * 0.87, 1e-9);
}

TEST(test_empty_report) {
    OrderReport r = build_report({});
    ASSERT_FALSE(r.profitable().has_value());
    ASSERT_EQ(r.win_rate(), 0.0);
    json j = report_to_json(r);
    ASSERT_TRUE(j["profitable"].is_null());
    ASSERT_TRUE(j["orders"].empty());
    ASSERT_EQ(j["netPnL"], 0.0);
}

// ============================================================================
// From events
// ============================================================================

TEST(test_latest_event_per_order_wins) {
    std::vector<core::Event> events;
    Order o = Order::from_band(1, 100, OrderType::Long, 5000, 5004);
    events.push_back(core::Event::make(core::Phase::Trading, 100, DAY, o));
    o.status = OrderStatus::Placed;
    events.push_back(core::Event::make(core::Phase::Trading, 101, DAY, o));
    Order other = Order::from_band(2, 50, OrderType::Short, 5000, 5004);
    events.push_back(core::Event::make(core::Phase::Trading, 102, DAY, other));

    auto orders = orders_from_events(events);
    ASSERT_EQ(orders.size(), 2u);
    ASSERT_EQ(orders[0].id, 2u); // by creation time
    ASSERT_EQ(orders[1].status, OrderStatus::Placed);
}

TEST(test_report_service_over_store) {
    EventStore store;
    for (const auto& o : sample_day())
        store.add(core::Event::make(core::Phase::Trading, o.timestamp, DAY, o));
    market::Candle c;
    c.timestamp = 60000;
    store.add(core::Event::make(core::Phase::Trading, c.timestamp, NEXT, c));
    Order ignored = closed(9, 900, OrderStatus::Profit, 950, "Planning");
    store.add(core::Event::make(core::Phase::Planning, 900, NEXT, ignored));

    ReportService service(store);
    ASSERT_EQ(service.daily(DAY).winning, 1);
    ASSERT_TRUE(service.daily(NEXT).orders.empty());
    ASSERT_EQ(service.aggregate().orders.size(), 4u);

    auto days = service.dates_with_profitability();
    ASSERT_EQ(days.size(), 2u);
    ASSERT_EQ(days[0].first, DAY);
    ASSERT_TRUE(*days[0].second);
    ASSERT_FALSE(days[1].second.has_value());

    json j = report_to_json(service.daily(DAY));
    ASSERT_EQ(j["winning"], 1);
    ASSERT_EQ(j["winRates"].size(), 2u);
    ASSERT_EQ(j["profitable"], true);
}

int main() {
    std::cout << "\n=== Report Tests ===\n\n";

    RUN_TEST(test_daily_statistics);
    RUN_TEST(test_drawdown_follows_close_order);
    RUN_TEST(test_strategy_win_rates_sorted);
    RUN_TEST(test_micro_contract_fees);
    RUN_TEST(test_empty_report);
    RUN_TEST(test_latest_event_per_order_wins);
    RUN_TEST(test_report_service_over_store);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
