#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>
#include "../include/broker/simulated_broker.hpp"
#include "../include/order/order_lifecycle.hpp"

using namespace zonetrader;
using namespace zonetrader::order;
using market::Candle;

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

Timestamp at(int hour, int minute) { return util::new_york_time(DAY, hour, minute); }

Candle make_candle(Timestamp ts, Price open, Price high, Price low, Price close) {
    Candle c;
    c.timestamp = ts;
    c.open = open;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = 100;
    return c;
}

// Long [5000, 5004]: entry 5004, stop 5000, target 5014
Order long_order(Timestamp created) { return Order::from_band(1, created, OrderType::Long, 5000, 5004); }

/**
 * Remote-style gateway with scripted answers.
 */
class ScriptedGateway : public broker::IBrokerGateway {
public:
    broker::BrokerResult place_result;
    broker::BrokerOrderReport report;
    int place_calls = 0;
    int closed_calls = 0;
    int pending_placements = 0; // answers Pending this many times first

    ScriptedGateway() {
        place_result.broker_order_id = 77;
        place_result.profit_leg_id = 78;
        place_result.stop_leg_id = 79;
    }

    const char* name() const override { return "scripted"; }
    bool simulates_fills() const override { return false; }
    broker::BrokerResult place_bracket(const Order&) override {
        ++place_calls;
        if (pending_placements > 0) {
            --pending_placements;
            return broker::BrokerResult::failure(broker::BrokerErrorKind::Pending, "queued", 0, 0);
        }
        return place_result;
    }
    broker::BrokerResult cancel_order(const Order&) override { return {}; }
    broker::BrokerResult liquidate(const Order&) override { return {}; }
    broker::BrokerResult query_order(const Order&, broker::BrokerOrderReport& out) override {
        out = report;
        return {};
    }
    std::optional<double> account_balance() override { return std::nullopt; }
    void on_order_closed(const Order&) override { ++closed_calls; }
};

// ============================================================================
// Order state machine
// ============================================================================

TEST(test_transitions_only_move_forward) {
    Order o = long_order(1000);
    ASSERT_EQ(o.transition(OrderStatus::Filled, 2000), TransitionResult::IllegalTransition);
    ASSERT_EQ(o.transition(OrderStatus::Placed, 500), TransitionResult::TimestampRegression);
    ASSERT_EQ(o.transition(OrderStatus::Placed, 2000), TransitionResult::Applied);
    ASSERT_EQ(o.transition(OrderStatus::Filled, 3000), TransitionResult::Applied);
    ASSERT_EQ(o.transition(OrderStatus::Cancelled, 4000), TransitionResult::IllegalTransition);
    ASSERT_EQ(o.transition(OrderStatus::Profit, 4000), TransitionResult::Applied);
    ASSERT_EQ(o.transition(OrderStatus::Loss, 5000), TransitionResult::AlreadyTerminal);
    ASSERT_EQ(*o.placed_timestamp, 2000);
    ASSERT_EQ(*o.filled_timestamp, 3000);
    ASSERT_EQ(*o.close_timestamp, 4000);
}

TEST(test_reconcile_fills_skipped_timestamps) {
    Order o = long_order(1000);
    ASSERT_EQ(o.reconcile_to(OrderStatus::Filled, 2500), TransitionResult::Applied);
    ASSERT_EQ(*o.placed_timestamp, 2500);
    ASSERT_EQ(*o.filled_timestamp, 2500);
    ASSERT_EQ(o.reconcile_to(OrderStatus::Placed, 3000), TransitionResult::IllegalTransition);
    ASSERT_EQ(o.reconcile_to(OrderStatus::Filled, 3000), TransitionResult::Applied);
}

TEST(test_bracket_geometry_and_sizing) {
    Order o = long_order(0);
    ASSERT_EQ(o.entry_price(), 5004);
    ASSERT_EQ(o.stop_loss(), 5000);
    ASSERT_NEAR(o.take_profit(), 5014.0, 1e-9);
    // $1000 over 4 points is 50 micros, which converts to 5 ES
    ASSERT_EQ(o.contract, "ES");
    ASSERT_EQ(o.contracts, 5);

    Order s = Order::from_band(2, 0, OrderType::Short, 5000, 5004);
    ASSERT_EQ(s.entry_price(), 5000);
    ASSERT_EQ(s.stop_loss(), 5004);
    ASSERT_NEAR(s.take_profit(), 4990.0, 1e-9);
}

// ============================================================================
// Simulated fills
// ============================================================================

TEST(test_simulated_trade_runs_to_target) {
    broker::SimulatedBroker broker;
    OrderLifecycle lifecycle(broker);
    std::vector<Order> orders = {long_order(at(13, 0))};

    // Close above the entry places the limit; the low stays above it
    auto changed = lifecycle.apply(orders, make_candle(at(13, 0), 5004.5, 5006, 5004.5, 5005));
    ASSERT_EQ(changed.size(), 1u);
    ASSERT_EQ(orders[0].status, OrderStatus::Placed);
    ASSERT_TRUE(orders[0].broker_order_id.has_value());

    lifecycle.apply(orders, make_candle(at(13, 1), 5005, 5006, 5003, 5005));
    ASSERT_EQ(orders[0].status, OrderStatus::Filled);

    lifecycle.apply(orders, make_candle(at(13, 2), 5006, 5015, 5006, 5012));
    ASSERT_EQ(orders[0].status, OrderStatus::Profit);
    ASSERT_NEAR(*orders[0].exit_price, 5014.0, 1e-9);
    ASSERT_NEAR(orders[0].r_multiple(), 2.5, 1e-9);

    // 2.5R of $1000 less 5 ES fees
    ASSERT_NEAR(*broker.account_balance(), 50000.0 + 2500.0 - 5 * 2.88, 1e-6);
    ASSERT_EQ(broker.working_count(), 0u);

    // Terminal orders are left alone
    ASSERT_TRUE(lifecycle.apply(orders, make_candle(at(13, 3), 5000, 5020, 4990, 5000)).empty());
}

TEST(test_stop_and_target_in_one_candle) {
    Order o = long_order(0);
    o.transition(OrderStatus::Placed, 0);
    o.transition(OrderStatus::Filled, 0);
    Candle green = make_candle(60000, 5001, 5015, 4999, 5010);
    Candle red = make_candle(60000, 5010, 5015, 4999, 5001);
    ASSERT_TRUE(OrderLifecycle::hit_stop(o, green));
    ASSERT_FALSE(OrderLifecycle::hit_target(o, green));
    ASSERT_FALSE(OrderLifecycle::hit_stop(o, red));
    ASSERT_TRUE(OrderLifecycle::hit_target(o, red));
}

TEST(test_planned_order_expires_unfilled) {
    broker::SimulatedBroker broker;
    OrderLifecycle lifecycle(broker);
    std::vector<Order> orders = {long_order(at(13, 0))};

    lifecycle.apply(orders, make_candle(at(13, 0), 5003, 5003.5, 5002, 5003));
    ASSERT_EQ(orders[0].status, OrderStatus::Planned);
    lifecycle.apply(orders, make_candle(at(13, 1), 5003, 5003.5, 5002, 5003));
    ASSERT_EQ(orders[0].status, OrderStatus::Cancelled);
    ASSERT_EQ(orders[0].cancel_reason, CancelReason::NotFilled);
    ASSERT_EQ(broker.placed_count(), 0u);
}

TEST(test_end_of_day_flattens_filled_order) {
    broker::SimulatedBroker broker;
    OrderLifecycle lifecycle(broker);
    Order o = long_order(at(15, 0));
    o.transition(OrderStatus::Placed, at(15, 1));
    o.transition(OrderStatus::Filled, at(15, 2));
    std::vector<Order> orders = {o};

    lifecycle.apply(orders, make_candle(at(15, 50), 5006, 5007, 5005, 5006));
    ASSERT_EQ(orders[0].status, OrderStatus::Profit);
    ASSERT_NEAR(*orders[0].exit_price, 5006.0, 1e-9);
    ASSERT_NEAR(orders[0].r_multiple(), 0.5, 1e-9);
}

TEST(test_end_of_day_cancels_planned_order) {
    broker::SimulatedBroker broker;
    OrderLifecycle lifecycle(broker);
    std::vector<Order> orders = {long_order(at(15, 49))};
    lifecycle.apply(orders, make_candle(at(15, 55), 5003, 5003, 5003, 5003));
    ASSERT_EQ(orders[0].status, OrderStatus::Cancelled);
    ASSERT_EQ(orders[0].cancel_reason, CancelReason::EndOfDay);
}

// ============================================================================
// Remote gateway
// ============================================================================

TEST(test_definitive_rejection_cancels_with_reason) {
    ScriptedGateway gateway;
    gateway.place_result = broker::BrokerResult::failure(broker::BrokerErrorKind::Definitive, "Insufficient margin", 400);
    OrderLifecycle lifecycle(gateway);
    std::vector<Order> orders = {long_order(at(13, 0))};

    lifecycle.apply(orders, make_candle(at(13, 0), 5005, 5006, 5004.5, 5005));
    ASSERT_EQ(orders[0].status, OrderStatus::Cancelled);
    ASSERT_EQ(orders[0].cancel_reason, "Insufficient margin");
    ASSERT_EQ(gateway.closed_calls, 1);
}

TEST(test_transient_failure_keeps_order_planned) {
    ScriptedGateway gateway;
    gateway.place_result = broker::BrokerResult::failure(broker::BrokerErrorKind::Transient, "broker unavailable", 429, 6);
    OrderLifecycle lifecycle(gateway);
    std::vector<Order> orders = {long_order(at(13, 0))};

    auto changed = lifecycle.apply(orders, make_candle(at(13, 0), 5005, 5006, 5004.5, 5005));
    ASSERT_EQ(orders[0].status, OrderStatus::Planned);
    ASSERT_EQ(orders[0].last_broker_error, "broker unavailable");
    ASSERT_EQ(changed.size(), 1u);
}

TEST(test_broker_report_drives_remote_order) {
    ScriptedGateway gateway;
    OrderLifecycle lifecycle(gateway);
    std::vector<Order> orders = {long_order(at(13, 0))};

    gateway.report.status = OrderStatus::Placed;
    lifecycle.apply(orders, make_candle(at(13, 0), 5005, 5006, 5004.5, 5005));
    ASSERT_EQ(orders[0].status, OrderStatus::Placed);
    ASSERT_EQ(*orders[0].broker_order_id, 77);

    gateway.report.status = OrderStatus::Filled;
    gateway.report.entry_fill_timestamp = at(13, 1) + 30000;
    lifecycle.apply(orders, make_candle(at(13, 1), 5005, 5006, 5003, 5004));
    ASSERT_EQ(orders[0].status, OrderStatus::Filled);
    ASSERT_EQ(*orders[0].filled_timestamp, at(13, 1) + 30000);

    gateway.report.status = OrderStatus::Loss;
    gateway.report.exit_price = 5000;
    gateway.report.exit_timestamp = at(13, 5);
    lifecycle.apply(orders, make_candle(at(13, 5), 5002, 5003, 4999, 5000));
    ASSERT_EQ(orders[0].status, OrderStatus::Loss);
    ASSERT_NEAR(orders[0].r_multiple(), -1.0, 1e-9);
    ASSERT_EQ(gateway.closed_calls, 1);
}

TEST(test_pending_placement_collected_on_later_candle) {
    ScriptedGateway gateway;
    gateway.pending_placements = 2;
    OrderLifecycle lifecycle(gateway);
    std::vector<Order> orders = {long_order(at(13, 0))};

    auto changed = lifecycle.apply(orders, make_candle(at(13, 0), 5005, 5006, 5004.5, 5005));
    ASSERT_TRUE(changed.empty());
    ASSERT_EQ(orders[0].status, OrderStatus::Planned);
    ASSERT_TRUE(orders[0].last_broker_error.empty());
    ASSERT_TRUE(lifecycle.placement_pending(orders[0]));

    // Below the entry and past the unfilled timeout: still asked, not expired
    changed = lifecycle.apply(orders, make_candle(at(13, 5), 5003, 5003.5, 5002, 5003));
    ASSERT_TRUE(changed.empty());
    ASSERT_EQ(orders[0].status, OrderStatus::Planned);

    changed = lifecycle.apply(orders, make_candle(at(13, 6), 5003, 5003.5, 5002, 5003));
    ASSERT_EQ(changed.size(), 1u);
    ASSERT_EQ(orders[0].status, OrderStatus::Placed);
    ASSERT_EQ(*orders[0].broker_order_id, 77);
    ASSERT_FALSE(lifecycle.placement_pending(orders[0]));
    ASSERT_EQ(gateway.place_calls, 3);
}

TEST(test_end_of_day_cancels_pending_placement_at_broker) {
    ScriptedGateway gateway;
    gateway.pending_placements = 1;
    OrderLifecycle lifecycle(gateway);
    std::vector<Order> orders = {long_order(at(15, 30))};

    lifecycle.apply(orders, make_candle(at(15, 30), 5005, 5006, 5004.5, 5005));
    ASSERT_EQ(orders[0].status, OrderStatus::Planned);

    // The bracket the broker accepted is cancelled there, not dropped locally
    lifecycle.apply(orders, make_candle(at(15, 55), 5003, 5003, 5003, 5003));
    ASSERT_EQ(orders[0].status, OrderStatus::Cancelled);
    ASSERT_EQ(orders[0].cancel_reason, CancelReason::EndOfDay);
    ASSERT_EQ(*orders[0].broker_order_id, 77);
    ASSERT_EQ(gateway.place_calls, 2);
    ASSERT_EQ(gateway.closed_calls, 1);
}

int main() {
    std::cout << "\n=== Order Lifecycle Tests ===\n\n";

    RUN_TEST(test_transitions_only_move_forward);
    RUN_TEST(test_reconcile_fills_skipped_timestamps);
    RUN_TEST(test_bracket_geometry_and_sizing);
    RUN_TEST(test_simulated_trade_runs_to_target);
    RUN_TEST(test_stop_and_target_in_one_candle);
    RUN_TEST(test_planned_order_expires_unfilled);
    RUN_TEST(test_end_of_day_flattens_filled_order);
    RUN_TEST(test_end_of_day_cancels_planned_order);
    RUN_TEST(test_definitive_rejection_cancels_with_reason);
    RUN_TEST(test_transient_failure_keeps_order_planned);
    RUN_TEST(test_broker_report_drives_remote_order);
    RUN_TEST(test_pending_placement_collected_on_later_candle);
    RUN_TEST(test_end_of_day_cancels_pending_placement_at_broker);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
