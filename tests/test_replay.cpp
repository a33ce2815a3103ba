#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>
#include "../include/broker/simulated_broker.hpp"
#include "../include/core/replay_coordinator.hpp"

using namespace zonetrader;
using namespace zonetrader::core;
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

const util::Date DAY = util::make_date(2024, 3, 14);

// Flat-ish candles every `step` from `start` to `end` inclusive
std::vector<Candle> series(Timestamp start, Timestamp end, Timestamp step) {
    std::vector<Candle> out;
    int i = 0;
    for (Timestamp ts = start; ts <= end; ts += step, ++i) {
        Candle c;
        c.timestamp = ts;
        c.open = 5000 + (i % 7) * 0.25;
        c.close = 5000 + ((i + 3) % 7) * 0.25;
        c.high = std::max(c.open, c.close) + 0.5;
        c.low = std::min(c.open, c.close) - 0.5;
        c.volume = 100 + (i % 11) * 10;
        c.duration_ms = step;
        out.push_back(c);
    }
    return out;
}

struct Sources {
    market::VectorCandleSource minute;
    market::VectorCandleSource five_minute;

    Sources()
        : minute(series(util::new_york_time(util::make_date(2024, 3, 11), 0, 0), util::new_york_time(DAY, 17, 0),
                        MS_PER_MINUTE)),
          five_minute(series(util::new_york_time(DAY, 0, 0), util::new_york_time(DAY, 17, 0), 5 * MS_PER_MINUTE)) {}
};

// ============================================================================
// PLAN
// ============================================================================

TEST(test_plan_range_covers_prior_days_to_open) {
    Sources sources;
    ReplayCoordinator replay(sources.minute, sources.five_minute, PipelineConfig{});
    auto [start, end] = replay.plan_range(DAY, 2);
    ASSERT_EQ(start, util::new_york_time(util::make_date(2024, 3, 12), 9, 0));
    ASSERT_EQ(end, util::new_york_time(DAY, 9, 30) - 1);

    // Non-positive day counts fall back to the default
    ASSERT_TRUE(replay.plan_range(DAY, 0) == replay.plan_range(DAY, 2));

    // Monday plans reach back over the weekend
    auto monday = replay.plan_range(util::make_date(2024, 3, 18), 1);
    ASSERT_EQ(monday.first, util::new_york_time(util::make_date(2024, 3, 15), 9, 0));
}

TEST(test_plan_emits_planning_events_for_the_date) {
    Sources sources;
    ReplayCoordinator replay(sources.minute, sources.five_minute, PipelineConfig{});
    auto [start, end] = replay.plan_range(DAY, 2);

    std::vector<Event> events;
    std::shared_ptr<const StreamSnapshot> snapshot;
    auto outcome = replay.plan(DAY, 2, [&](const Event& e) { events.push_back(e); }, nullptr, &snapshot);
    ASSERT_EQ(outcome, RunOutcome::Completed);
    ASSERT_FALSE(events.empty());
    ASSERT_EQ(events.front().timestamp, start);
    for (const auto& e : events) {
        ASSERT_EQ(e.phase, Phase::Planning);
        ASSERT_EQ(e.trading_day, DAY);
        ASSERT_TRUE(e.timestamp >= start && e.timestamp <= end);
    }
    ASSERT_TRUE(snapshot != nullptr);
    ASSERT_EQ(snapshot->last_candle->timestamp, end + 1 - MS_PER_MINUTE);
    ASSERT_TRUE(snapshot->orders.empty());
}

TEST(test_plan_honours_cancellation) {
    Sources sources;
    ReplayCoordinator replay(sources.minute, sources.five_minute, PipelineConfig{});
    CancelFlag flag = make_cancel_flag();
    flag->store(true);
    size_t seen = 0;
    ASSERT_EQ(replay.plan(DAY, 2, [&](const Event&) { ++seen; }, flag), RunOutcome::Cancelled);
    ASSERT_EQ(seen, 0u);
}

// ============================================================================
// TRADE
// ============================================================================

TEST(test_trade_streams_context_from_warm_up) {
    Sources sources;
    ReplayCoordinator replay(sources.minute, sources.five_minute, PipelineConfig{});

    StreamSnapshot snapshot;
    zones::LiquidityExtreme london;
    london.market = util::Market::London;
    london.kind = zones::ExtremeKind::High;
    london.level = 5010;
    london.start_timestamp = util::new_york_time(DAY, 3, 0);
    zones::LiquidityExtreme spent = london;
    spent.market = util::Market::Asia;
    spent.end_timestamp = util::new_york_time(DAY, 1, 0);
    snapshot.extremes = {london, spent};

    zones::PlanZone zone;
    zone.kind = zones::PlanZoneKind::Demand;
    zone.low = 4990;
    zone.high = 4995;
    zone.start_timestamp = util::new_york_time(DAY, 5, 2);
    snapshot.plan_zones = {zone};

    std::vector<Event> events;
    ASSERT_EQ(replay.trade(snapshot, DAY, [&](const Event& e) { events.push_back(e); }), RunOutcome::Completed);

    ASSERT_FALSE(events.empty());
    ASSERT_EQ(events.front().type(), EventType::Candle);
    ASSERT_EQ(events.front().timestamp, util::new_york_time(DAY, 2, 0));

    size_t extreme_events = 0;
    size_t zone_events = 0;
    Timestamp previous = 0;
    for (size_t i = 0; i < events.size(); ++i) {
        const auto& e = events[i];
        ASSERT_EQ(e.phase, Phase::Trading);
        ASSERT_TRUE(e.timestamp >= previous);
        ASSERT_TRUE(e.timestamp < util::new_york_time(DAY, 9, 30));
        previous = e.timestamp;
        if (e.type() == EventType::Candle)
            ASSERT_EQ(e.get<Candle>()->duration_ms, 5 * MS_PER_MINUTE);
        if (e.type() == EventType::LiquidityExtreme) {
            ++extreme_events;
            ASSERT_EQ(e.get<zones::LiquidityExtreme>()->market, util::Market::London);
            ASSERT_EQ(e.timestamp, util::new_york_time(DAY, 3, 0));
        }
        if (e.type() == EventType::PlanZone) {
            ++zone_events;
            // Released with the first candle at or after the zone start
            ASSERT_EQ(e.timestamp, util::new_york_time(DAY, 5, 5));
            ASSERT_EQ(events[i - 1].type(), EventType::Candle);
        }
    }
    ASSERT_EQ(extreme_events, 1u);
    ASSERT_EQ(zone_events, 1u);
}

TEST(test_trade_without_context_warms_up_an_hour) {
    Sources sources;
    ReplayCoordinator replay(sources.minute, sources.five_minute, PipelineConfig{});
    std::vector<Event> events;
    replay.trade(StreamSnapshot{}, DAY, [&](const Event& e) { events.push_back(e); });
    ASSERT_EQ(events.size(), 12u);
    ASSERT_EQ(events.front().timestamp, util::new_york_time(DAY, 8, 30));
    ASSERT_EQ(events.back().timestamp, util::new_york_time(DAY, 9, 25));
}

// ============================================================================
// Backtest
// ============================================================================

TEST(test_backtest_emits_only_the_session) {
    Sources sources;
    PipelineConfig config;
    config.decision.min_signal_score = 0;
    ReplayCoordinator replay(sources.minute, sources.five_minute, config);
    broker::SimulatedBroker broker;

    std::vector<Event> events;
    auto outcome = replay.backtest(DAY, 1, broker, [&](const Event& e) { events.push_back(e); });
    ASSERT_EQ(outcome, RunOutcome::Completed);
    ASSERT_FALSE(events.empty());
    ASSERT_EQ(events.front().timestamp, util::new_york_time(DAY, 9, 30));
    for (const auto& e : events) {
        ASSERT_EQ(e.phase, Phase::Trading);
        ASSERT_TRUE(e.timestamp >= util::new_york_time(DAY, 9, 30));
        ASSERT_TRUE(e.timestamp <= util::new_york_time(DAY, 16, 0));
        if (const auto* o = e.get<order::Order>())
            ASSERT_TRUE(o->timestamp >= util::new_york_time(DAY, 9, 30));
    }
}

int main() {
    std::cout << "\n=== Replay Coordinator Tests ===\n\n";

    RUN_TEST(test_plan_range_covers_prior_days_to_open);
    RUN_TEST(test_plan_emits_planning_events_for_the_date);
    RUN_TEST(test_plan_honours_cancellation);
    RUN_TEST(test_trade_streams_context_from_warm_up);
    RUN_TEST(test_trade_without_context_warms_up_an_hour);
    RUN_TEST(test_backtest_emits_only_the_session);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
