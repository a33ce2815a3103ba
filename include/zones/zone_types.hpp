#pragma once

#include "../types.hpp"
#include "../util/market_calendar.hpp"

#include <cstdint>
#include <optional>

namespace zonetrader {
namespace zones {

using util::Market;

enum class SwingKind : uint8_t { High = 0, Low = 1 };

inline const char* swing_kind_to_string(SwingKind kind) {
    switch (kind) {
    case SwingKind::High:
        return "High";
    case SwingKind::Low:
        return "Low";
    default:
        return "Unknown";
    }
}

/**
 * Confirmed local pivot. `direction` is the move that followed it:
 * a high pivot turns Down, a low pivot turns Up.
 */
struct SwingPoint {
    Timestamp timestamp = 0;
    Price price = 0;
    SwingKind kind = SwingKind::High;
    Direction direction = Direction::Down;

    bool operator==(const SwingPoint& other) const = default;
};

enum class ExtremeKind : uint8_t { High = 0, Low = 1 };

inline const char* extreme_kind_to_string(ExtremeKind kind) {
    switch (kind) {
    case ExtremeKind::High:
        return "High";
    case ExtremeKind::Low:
        return "Low";
    default:
        return "Unknown";
    }
}

/**
 * Session high or low. Active while end_timestamp is empty.
 */
struct LiquidityExtreme {
    Market market = Market::NewYork;
    ExtremeKind kind = ExtremeKind::High;
    Price level = 0;
    Timestamp start_timestamp = 0;
    std::optional<Timestamp> end_timestamp;

    bool is_active() const { return !end_timestamp.has_value(); }
    bool operator==(const LiquidityExtreme& other) const = default;
};

enum class PlanZoneKind : uint8_t { Demand = 0, Supply = 1 };

inline const char* plan_zone_kind_to_string(PlanZoneKind kind) {
    switch (kind) {
    case PlanZoneKind::Demand:
        return "Demand";
    case PlanZoneKind::Supply:
        return "Supply";
    default:
        return "Unknown";
    }
}

/**
 * Supply/demand band. Identified by start_timestamp.
 */
struct PlanZone {
    PlanZoneKind kind = PlanZoneKind::Demand;
    Price low = 0;
    Price high = 0;
    Timestamp start_timestamp = 0;
    std::optional<Timestamp> end_timestamp;

    bool is_active() const { return !end_timestamp.has_value(); }

    bool contains(Price price) const { return price >= low && price <= high; }

    // Both active, same kind, this band covers the other
    bool engulfs(const PlanZone& other) const {
        return kind == other.kind && is_active() && other.is_active() && high >= other.high && low <= other.low;
    }

    bool operator==(const PlanZone& other) const = default;
};

} // namespace zones
} // namespace zonetrader
