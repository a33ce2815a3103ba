#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "../include/report/event_store.hpp"

using namespace zonetrader;
using namespace zonetrader::core;
using report::EventStore;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

namespace fs = std::filesystem;

const util::Date DAY = util::make_date(2024, 3, 14);
const util::Date EARLIER = util::make_date(2024, 3, 13);

Event candle_event(const util::Date& day, Phase phase, Timestamp ts) {
    market::Candle c;
    c.timestamp = ts;
    c.open = c.close = 5000;
    c.high = 5001;
    c.low = 4999;
    c.volume = 10;
    return Event::make(phase, ts, day, c);
}

Event order_event(const util::Date& day, OrderId id, order::OrderStatus status) {
    auto o = order::Order::from_band(id, 1000, OrderType::Long, 5000, 5004);
    o.status = status;
    return Event::make(Phase::Trading, 1000, day, o);
}

fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("zonetrader_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    return dir;
}

// ============================================================================
// In memory
// ============================================================================

TEST(test_events_grouped_by_date_and_phase) {
    EventStore store;
    store.add(candle_event(DAY, Phase::Planning, 1));
    store.add(candle_event(DAY, Phase::Trading, 2));
    store.add(candle_event(DAY, Phase::Trading, 3));
    store.add(candle_event(EARLIER, Phase::Trading, 4));

    ASSERT_EQ(store.get(DAY, Phase::Planning).events.size(), 1u);
    auto trading = store.get(DAY, Phase::Trading);
    ASSERT_EQ(trading.events.size(), 2u);
    ASSERT_EQ(trading.events[0].timestamp, 2);
    ASSERT_FALSE(trading.complete);

    auto dates = store.available_dates();
    ASSERT_EQ(dates.size(), 2u);
    ASSERT_EQ(dates[0], EARLIER);
    ASSERT_EQ(dates[1], DAY);
}

TEST(test_complete_phase_rejects_events) {
    EventStore store;
    store.add(candle_event(DAY, Phase::Planning, 1));
    store.mark_complete(DAY, Phase::Planning);
    store.add(candle_event(DAY, Phase::Planning, 2));
    ASSERT_TRUE(store.is_complete(DAY, Phase::Planning));
    ASSERT_FALSE(store.is_complete(DAY, Phase::Trading));
    ASSERT_EQ(store.get(DAY, Phase::Planning).events.size(), 1u);

    store.clear(DAY, Phase::Planning);
    ASSERT_FALSE(store.is_complete(DAY, Phase::Planning));
    ASSERT_TRUE(store.get(DAY, Phase::Planning).events.empty());
}

TEST(test_orders_filtered_in_emission_order) {
    EventStore store;
    store.add(order_event(DAY, 1, order::OrderStatus::Planned));
    store.add(candle_event(DAY, Phase::Trading, 2));
    store.add(order_event(DAY, 1, order::OrderStatus::Placed));
    store.add(order_event(DAY, 2, order::OrderStatus::Planned));

    auto orders = store.orders(DAY);
    ASSERT_EQ(orders.size(), 3u);
    ASSERT_EQ(orders[1].status, order::OrderStatus::Placed);
    ASSERT_EQ(orders[2].id, 2u);
    ASSERT_TRUE(store.orders(EARLIER).empty());

    store.clear_all();
    ASSERT_TRUE(store.available_dates().empty());
}

// ============================================================================
// Persistence
// ============================================================================

TEST(test_persisted_events_reload) {
    fs::path dir = scratch_dir("store");
    {
        EventStore store(dir.string());
        store.add(candle_event(DAY, Phase::Trading, 10));
        store.add(order_event(DAY, 4, order::OrderStatus::Planned));
        store.add(candle_event(EARLIER, Phase::Planning, 20));
    }
    ASSERT_TRUE(fs::exists(dir / "2024-03-14_trading.jsonl"));
    ASSERT_TRUE(fs::exists(dir / "2024-03-13_planning.jsonl"));

    {
        std::ofstream out(dir / "2024-03-14_trading.jsonl", std::ios::app);
        out << "not json\n\n";
    }
    std::ofstream(dir / "notes.txt") << "ignored";

    EventStore reloaded(dir.string());
    ASSERT_EQ(reloaded.load(), 3u);
    auto trading = reloaded.get(DAY, Phase::Trading);
    ASSERT_TRUE(trading.complete);
    ASSERT_EQ(trading.events.size(), 2u);
    ASSERT_EQ(trading.events[0].type(), EventType::Candle);
    ASSERT_EQ(reloaded.orders(DAY).front().id, 4u);
    ASSERT_EQ(reloaded.get(EARLIER, Phase::Planning).events.front().timestamp, 20);

    fs::remove_all(dir);
}

TEST(test_load_without_directory) {
    EventStore store;
    ASSERT_EQ(store.load(), 0u);
    EventStore missing((fs::temp_directory_path() / "zonetrader_missing_dir_x").string());
    fs::remove_all(missing.directory());
    ASSERT_EQ(missing.load(), 0u);
}

int main() {
    std::cout << "\n=== Event Store Tests ===\n\n";

    RUN_TEST(test_events_grouped_by_date_and_phase);
    RUN_TEST(test_complete_phase_rejects_events);
    RUN_TEST(test_orders_filtered_in_emission_order);
    RUN_TEST(test_persisted_events_reload);
    RUN_TEST(test_load_without_directory);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
