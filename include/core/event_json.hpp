#pragma once

#include "event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace zonetrader {
namespace core {

using json = nlohmann::json;

json candle_to_json(const market::Candle& candle);
json swing_point_to_json(const zones::SwingPoint& swing);
json liquidity_extreme_to_json(const zones::LiquidityExtreme& extreme);
json plan_zone_to_json(const zones::PlanZone& zone);
json technical_analysis_to_json(const analysis::TechnicalAnalysis& row);
json order_to_json(const order::Order& order);

/**
 * Wire form of an event:
 *   {"eventType": "...", "timestamp": ms, "phase": "...", "tradingDate": "YYYY-MM-DD", "<payload>": {...}}
 * The payload key is the camel-cased event type (candle, swingPoint, ...).
 */
json event_to_json(const Event& event);

// Serialized once per event and fanned out as-is
std::string serialize_event(const Event& event);

// Parsers return nullopt on missing or mistyped fields
std::optional<market::Candle> candle_from_json(const json& j);
std::optional<zones::SwingPoint> swing_point_from_json(const json& j);
std::optional<zones::LiquidityExtreme> liquidity_extreme_from_json(const json& j);
std::optional<zones::PlanZone> plan_zone_from_json(const json& j);
std::optional<order::Order> order_from_json(const json& j);

/**
 * Rebuild an event from its wire form. TechnicalAnalysis rows are not
 * parsed back (they are display-only) and yield nullopt.
 */
std::optional<Event> event_from_json(const json& j);

} // namespace core
} // namespace zonetrader
