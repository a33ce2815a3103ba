#pragma once

#include "../analysis/analysis_types.hpp"
#include "../market/candle.hpp"
#include "../order/order.hpp"
#include "../util/time_utils.hpp"
#include "../zones/zone_types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace zonetrader {
namespace core {

struct StreamConfig {
    size_t max_candles = 500;        // rolling window; analytics are pruned with it
    int swing_confirmations = 1;     // candles on each side of a pivot
    size_t max_swings = 500;
    size_t max_liquidity_history = 60;
    size_t max_plan_zones = 200;
    size_t max_closed_history = 1000; // closed orders kept for risk sizing
    bool emit_analysis = true;        // TechnicalAnalysis events
};

/**
 * StreamState - everything one stream knows, owned by its single writer
 *
 * candles and analytics are index-aligned and always the same length.
 * orders holds the current trading day; finished orders move to
 * closed_orders at the day rollover.
 */
struct StreamState {
    std::optional<util::Date> trading_day;
    std::vector<market::Candle> candles;
    std::vector<analysis::TechnicalAnalysis> analytics;
    std::vector<zones::SwingPoint> swings;
    std::vector<zones::LiquidityExtreme> extremes;
    std::vector<zones::PlanZone> plan_zones;
    std::vector<order::Order> orders;
    std::vector<order::Order> closed_orders;
    OrderId next_order_id = 1;
    uint64_t processed = 0;

    const market::Candle* last_candle() const { return candles.empty() ? nullptr : &candles.back(); }

    bool is_aligned() const { return candles.size() == analytics.size(); }

    bool has_active_order() const {
        return std::any_of(orders.begin(), orders.end(), [](const order::Order& o) { return o.is_active(); });
    }

    // Drop the oldest candles (and their analytics) beyond the cap
    void prune_window(size_t max_candles) {
        if (candles.size() > max_candles) {
            size_t excess = candles.size() - max_candles;
            candles.erase(candles.begin(), candles.begin() + static_cast<std::ptrdiff_t>(excess));
        }
        if (analytics.size() > candles.size()) {
            size_t excess = analytics.size() - candles.size();
            analytics.erase(analytics.begin(), analytics.begin() + static_cast<std::ptrdiff_t>(excess));
        }
    }

    void prune_swings(size_t max_swings) {
        if (swings.size() > max_swings)
            swings.erase(swings.begin(), swings.begin() + static_cast<std::ptrdiff_t>(swings.size() - max_swings));
    }

    /**
     * Start a new trading day: terminal orders join the closed history,
     * still-active ones carry over.
     */
    void roll_to(const util::Date& day, size_t max_closed_history) {
        trading_day = day;
        std::vector<order::Order> carried;
        for (auto& o : orders) {
            if (o.is_active())
                carried.push_back(std::move(o));
            else
                closed_orders.push_back(std::move(o));
        }
        orders = std::move(carried);
        if (closed_orders.size() > max_closed_history) {
            closed_orders.erase(closed_orders.begin(),
                                closed_orders.begin() +
                                    static_cast<std::ptrdiff_t>(closed_orders.size() - max_closed_history));
        }
    }
};

/**
 * Immutable view of a stream published after each candle. Readers on other
 * threads hold a shared_ptr to it and never touch the live state.
 */
struct StreamSnapshot {
    std::optional<util::Date> trading_day;
    std::optional<market::Candle> last_candle;
    std::optional<analysis::TechnicalAnalysis> latest_analysis;
    std::vector<zones::LiquidityExtreme> extremes;
    std::vector<zones::PlanZone> plan_zones;
    std::vector<order::Order> orders;
    size_t candle_count = 0;
    size_t swing_count = 0;
    uint64_t processed = 0;

    static StreamSnapshot of(const StreamState& state) {
        StreamSnapshot snapshot;
        snapshot.trading_day = state.trading_day;
        if (!state.candles.empty())
            snapshot.last_candle = state.candles.back();
        if (!state.analytics.empty())
            snapshot.latest_analysis = state.analytics.back();
        snapshot.extremes = state.extremes;
        for (const auto& zone : state.plan_zones) {
            if (zone.is_active())
                snapshot.plan_zones.push_back(zone);
        }
        snapshot.orders = state.orders;
        snapshot.candle_count = state.candles.size();
        snapshot.swing_count = state.swings.size();
        snapshot.processed = state.processed;
        return snapshot;
    }

    std::vector<zones::LiquidityExtreme> active_extremes() const {
        std::vector<zones::LiquidityExtreme> active;
        for (const auto& extreme : extremes) {
            if (extreme.is_active())
                active.push_back(extreme);
        }
        return active;
    }
};

} // namespace core
} // namespace zonetrader
