#pragma once

/**
 * Event - tagged union of everything a stream emits
 *
 * The payload alternatives are declared in emission order: for one candle a
 * stream emits its Candle, then SwingPoints, LiquidityExtremes, PlanZones,
 * the TechnicalAnalysis row and finally Order updates. type() follows the
 * same order, so comparing types compares emission rank.
 */

#include "../analysis/analysis_types.hpp"
#include "../market/candle.hpp"
#include "../order/order.hpp"
#include "../types.hpp"
#include "../util/time_utils.hpp"
#include "../zones/zone_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace zonetrader {
namespace core {

/**
 * Logical phase label. Replays and the live stream share one distribution
 * channel; subscribers separate them by phase.
 */
enum class Phase : uint8_t { Planning = 0, Trading = 1 };

inline const char* phase_to_string(Phase phase) {
    switch (phase) {
    case Phase::Planning:
        return "planning";
    case Phase::Trading:
        return "trading";
    default:
        return "unknown";
    }
}

// Case-insensitive
inline std::optional<Phase> phase_from_string(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower.push_back(static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));
    if (lower == "planning")
        return Phase::Planning;
    if (lower == "trading")
        return Phase::Trading;
    return std::nullopt;
}

enum class EventType : uint8_t {
    Candle = 0,
    SwingPoint = 1,
    LiquidityExtreme = 2,
    PlanZone = 3,
    TechnicalAnalysis = 4,
    Order = 5,
};

inline const char* event_type_to_string(EventType type) {
    switch (type) {
    case EventType::Candle:
        return "Candle";
    case EventType::SwingPoint:
        return "SwingPoint";
    case EventType::LiquidityExtreme:
        return "LiquidityExtreme";
    case EventType::PlanZone:
        return "PlanZone";
    case EventType::TechnicalAnalysis:
        return "TechnicalAnalysis";
    case EventType::Order:
        return "Order";
    default:
        return "Unknown";
    }
}

using EventPayload = std::variant<market::Candle, zones::SwingPoint, zones::LiquidityExtreme, zones::PlanZone,
                                  analysis::TechnicalAnalysis, order::Order>;

struct Event {
    Phase phase = Phase::Trading;
    Timestamp timestamp = 0;
    util::Date trading_day{};
    EventPayload payload;

    EventType type() const { return static_cast<EventType>(payload.index()); }

    template <typename T>
    const T* get() const {
        return std::get_if<T>(&payload);
    }

    // The candle timestamp that produced the event
    static Event make(Phase phase, Timestamp timestamp, const util::Date& trading_day, EventPayload payload) {
        Event event;
        event.phase = phase;
        event.timestamp = timestamp;
        event.trading_day = trading_day;
        event.payload = std::move(payload);
        return event;
    }
};

} // namespace core
} // namespace zonetrader
