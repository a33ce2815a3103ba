#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "../include/broker/simulated_broker.hpp"
#include "../include/core/event_json.hpp"
#include "../include/core/event_pipeline.hpp"

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

Candle make_candle(Timestamp ts, Price high, Price low, Price close) {
    Candle c;
    c.timestamp = ts;
    c.open = close;
    c.high = high;
    c.low = low;
    c.close = close;
    c.volume = 100;
    return c;
}

std::vector<Candle> noisy(Timestamp start, size_t count) {
    std::vector<Candle> out;
    uint32_t seed = 4242;
    Price price = 5000;
    for (size_t i = 0; i < count; ++i) {
        seed = seed * 1103515245u + 12345u;
        Price open = price;
        price += static_cast<double>((seed >> 16) % 9) * 0.25 - 1.0;
        Candle c = make_candle(start + static_cast<Timestamp>(i) * MS_PER_MINUTE, std::max(open, price) + 0.5,
                               std::min(open, price) - 0.5, price);
        c.open = open;
        c.volume = 50 + static_cast<Volume>((seed >> 8) % 300);
        out.push_back(c);
    }
    return out;
}

size_t count_type(const std::vector<Event>& events, EventType type) {
    size_t n = 0;
    for (const auto& e : events)
        if (e.type() == type)
            ++n;
    return n;
}

// ============================================================================
// Per-candle processing
// ============================================================================

TEST(test_swing_emitted_after_third_candle) {
    EventPipeline pipeline(Phase::Trading, PipelineConfig{}, nullptr);
    Timestamp t = util::new_york_time(DAY, 13, 0);

    auto first = pipeline.process(make_candle(t, 100.5, 99.5, 100));
    auto second = pipeline.process(make_candle(t + MS_PER_MINUTE, 101.5, 100.5, 101));
    ASSERT_EQ(count_type(first, EventType::SwingPoint), 0u);
    ASSERT_EQ(count_type(second, EventType::SwingPoint), 0u);

    auto third = pipeline.process(make_candle(t + 2 * MS_PER_MINUTE, 99.5, 98.5, 99));
    ASSERT_EQ(count_type(third, EventType::SwingPoint), 1u);
    const auto* swing = third[1].get<zones::SwingPoint>();
    ASSERT_TRUE(swing != nullptr);
    ASSERT_EQ(swing->kind, zones::SwingKind::High);
    ASSERT_EQ(swing->price, 101.5);
    ASSERT_EQ(swing->timestamp, t + MS_PER_MINUTE);
}

TEST(test_events_follow_fixed_order) {
    EventPipeline pipeline(Phase::Planning, PipelineConfig{}, nullptr);
    // London session candles create liquidity extremes
    for (const auto& candle : noisy(util::new_york_time(DAY, 4, 0), 60)) {
        auto events = pipeline.process(candle);
        ASSERT_FALSE(events.empty());
        ASSERT_EQ(events.front().type(), EventType::Candle);
        ASSERT_EQ(events.back().type(), EventType::TechnicalAnalysis);
        for (size_t i = 1; i < events.size(); ++i) {
            ASSERT_TRUE(events[i - 1].type() <= events[i].type());
            ASSERT_EQ(events[i].timestamp, candle.timestamp);
            ASSERT_EQ(events[i].phase, Phase::Planning);
        }
    }
    ASSERT_FALSE(pipeline.stream_state().extremes.empty());
}

TEST(test_out_of_order_candle_dropped) {
    EventPipeline pipeline(Phase::Trading, PipelineConfig{}, nullptr);
    Timestamp t = util::new_york_time(DAY, 13, 0);
    pipeline.process(make_candle(t, 101, 99, 100));
    ASSERT_TRUE(pipeline.process(make_candle(t - MS_PER_MINUTE, 101, 99, 100)).empty());
    ASSERT_EQ(pipeline.stream_state().candles.size(), 1u);
}

TEST(test_window_and_analytics_stay_aligned) {
    PipelineConfig config;
    config.stream.max_candles = 50;
    EventPipeline pipeline(Phase::Trading, config, nullptr);
    for (const auto& candle : noisy(util::new_york_time(DAY, 12, 0), 120)) {
        pipeline.process(candle);
        ASSERT_TRUE(pipeline.stream_state().is_aligned());
        ASSERT_TRUE(pipeline.stream_state().candles.size() <= 50u);
    }
    ASSERT_EQ(pipeline.stream_state().processed, 120u);
    ASSERT_EQ(pipeline.snapshot()->processed, 120u);
    ASSERT_EQ(pipeline.snapshot()->candle_count, 50u);
}

TEST(test_replay_is_deterministic) {
    auto candles = noisy(util::new_york_time(DAY, 3, 0), 300);
    std::vector<std::string> a;
    std::vector<std::string> b;
    EventPipeline first(Phase::Planning, PipelineConfig{}, [&](const Event& e) { a.push_back(serialize_event(e)); });
    EventPipeline second(Phase::Planning, PipelineConfig{}, [&](const Event& e) { b.push_back(serialize_event(e)); });
    for (const auto& c : candles) {
        first.process(c);
        second.process(c);
    }
    ASSERT_EQ(a.size(), b.size());
    ASSERT_TRUE(a == b);

    const auto& x = first.stream_state().analytics;
    const auto& y = second.stream_state().analytics;
    for (size_t i = 0; i < x.size(); ++i) {
        ASSERT_EQ(x[i].momentum.rsi, y[i].momentum.rsi);
        ASSERT_EQ(x[i].trend.adx, y[i].trend.adx);
        ASSERT_EQ(x[i].volatility.true_range.atr, y[i].volatility.true_range.atr);
    }
}

TEST(test_trading_day_rolls_and_can_be_pinned) {
    EventPipeline pipeline(Phase::Trading, PipelineConfig{}, nullptr);
    pipeline.process(make_candle(util::new_york_time(DAY, 17, 0), 101, 99, 100));
    ASSERT_EQ(*pipeline.stream_state().trading_day, DAY);
    auto events = pipeline.process(make_candle(util::new_york_time(DAY, 18, 0), 101, 99, 100));
    ASSERT_EQ(*pipeline.stream_state().trading_day, util::make_date(2024, 3, 15));
    ASSERT_EQ(events.front().trading_day, util::make_date(2024, 3, 15));

    EventPipeline pinned(Phase::Planning, PipelineConfig{}, nullptr);
    pinned.pin_trading_day(DAY);
    pinned.process(make_candle(util::new_york_time(util::make_date(2024, 3, 12), 11, 0), 101, 99, 100));
    ASSERT_EQ(*pinned.stream_state().trading_day, DAY);
}

TEST(test_live_stream_tracks_new_york_session) {
    // Not pinned: the trading day follows the candles, as on a live feed
    EventPipeline pipeline(Phase::Trading, PipelineConfig{}, nullptr);
    Timestamp start = util::new_york_time(util::make_date(2024, 3, 13), 9, 0);
    Timestamp end = util::new_york_time(DAY, 11, 0);
    for (const auto& c : noisy(start, static_cast<size_t>((end - start) / MS_PER_MINUTE) + 1))
        pipeline.process(c);
    ASSERT_EQ(*pipeline.stream_state().trading_day, DAY);

    const auto& extremes = pipeline.stream_state().extremes;
    using zones::ExtremeKind;
    using zones::LiquidityZoneTracker;
    ASSERT_EQ(LiquidityZoneTracker::active_count(extremes, util::Market::NewYork, ExtremeKind::High), 1u);
    ASSERT_EQ(LiquidityZoneTracker::active_count(extremes, util::Market::NewYork, ExtremeKind::Low), 1u);

    size_t new_york = 0;
    for (const auto& e : extremes) {
        if (e.market != util::Market::NewYork)
            continue;
        ++new_york;
        if (e.is_active())
            ASSERT_TRUE(e.start_timestamp >= util::new_york_open(DAY));
    }
    // The 2024-03-13 session left its own pair behind
    ASSERT_TRUE(new_york >= 4);
}

TEST(test_no_orders_without_broker) {
    PipelineConfig config;
    config.decision.min_signal_score = 0;
    EventPipeline pipeline(Phase::Trading, config, nullptr);
    for (const auto& candle : noisy(util::new_york_time(DAY, 12, 0), 200))
        ASSERT_EQ(count_type(pipeline.process(candle), EventType::Order), 0u);
    ASSERT_TRUE(pipeline.stream_state().orders.empty());
}

TEST(test_at_most_one_active_order_with_broker) {
    PipelineConfig config;
    config.decision.min_signal_score = 0;
    config.decision.breakout_min_score = 0;
    config.decision.blackout_enabled = false;
    broker::SimulatedBroker broker;
    EventPipeline pipeline(Phase::Trading, config, nullptr);
    pipeline.attach_broker(&broker);
    for (const auto& candle : noisy(util::new_york_time(DAY, 9, 30), 360)) {
        pipeline.process(candle);
        size_t active = 0;
        for (const auto& o : pipeline.stream_state().orders)
            if (o.is_active())
                ++active;
        ASSERT_TRUE(active <= 1);
    }
}

// ============================================================================
// Runs
// ============================================================================

TEST(test_run_completes_over_range) {
    auto candles = noisy(util::new_york_time(DAY, 9, 30), 30);
    market::VectorCandleSource source(candles);
    size_t seen = 0;
    EventPipeline pipeline(Phase::Planning, PipelineConfig{}, [&](const Event& e) {
        if (e.type() == EventType::Candle)
            ++seen;
    });
    ASSERT_EQ(pipeline.state(), PipelineState::Idle);
    auto outcome = pipeline.run(source, candles[5].timestamp, candles[14].timestamp);
    ASSERT_EQ(outcome, RunOutcome::Completed);
    ASSERT_EQ(pipeline.state(), PipelineState::Completed);
    ASSERT_EQ(seen, 10u);
    ASSERT_TRUE(pipeline.events_emitted() >= 20u);

    // A pipeline runs once
    ASSERT_EQ(pipeline.run(source, 0, candles.back().timestamp), RunOutcome::Completed);
    ASSERT_EQ(seen, 10u);
}

TEST(test_run_cancelled_by_flag) {
    auto candles = noisy(util::new_york_time(DAY, 9, 30), 30);
    market::VectorCandleSource source(candles);
    CancelFlag flag = make_cancel_flag();
    size_t seen = 0;
    EventPipeline pipeline(Phase::Planning, PipelineConfig{}, [&](const Event& e) {
        if (e.type() == EventType::Candle && ++seen == 3)
            flag->store(true);
    });
    ASSERT_EQ(pipeline.run(source, 0, candles.back().timestamp, flag), RunOutcome::Cancelled);
    ASSERT_EQ(pipeline.state(), PipelineState::Cancelled);
    ASSERT_EQ(seen, 3u);
}

int main() {
    std::cout << "\n=== Event Pipeline Tests ===\n\n";

    RUN_TEST(test_swing_emitted_after_third_candle);
    RUN_TEST(test_events_follow_fixed_order);
    RUN_TEST(test_out_of_order_candle_dropped);
    RUN_TEST(test_window_and_analytics_stay_aligned);
    RUN_TEST(test_replay_is_deterministic);
    RUN_TEST(test_trading_day_rolls_and_can_be_pinned);
    RUN_TEST(test_live_stream_tracks_new_york_session);
    RUN_TEST(test_no_orders_without_broker);
    RUN_TEST(test_at_most_one_active_order_with_broker);
    RUN_TEST(test_run_completes_over_range);
    RUN_TEST(test_run_cancelled_by_flag);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
