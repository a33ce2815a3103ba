#include "../../include/core/event_json.hpp"

#include <type_traits>

namespace zonetrader {
namespace core {

namespace {

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
bool read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        return false;
    }
    return true;
}

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    T value{};
    if (read(j, key, value))
        out = value;
    else
        out.reset();
}

std::optional<OrderType> order_type_from_string(const std::string& name) {
    if (name == "Long")
        return OrderType::Long;
    if (name == "Short")
        return OrderType::Short;
    return std::nullopt;
}

std::optional<order::OrderStatus> order_status_from_string(const std::string& name) {
    for (auto status : {order::OrderStatus::Planned, order::OrderStatus::Placed, order::OrderStatus::Filled,
                        order::OrderStatus::Profit, order::OrderStatus::Loss, order::OrderStatus::Cancelled}) {
        if (name == order::order_status_to_string(status))
            return status;
    }
    return std::nullopt;
}

std::optional<util::Market> market_from_string(const std::string& name) {
    for (auto market : {util::Market::NewYork, util::Market::Asia, util::Market::London}) {
        if (name == util::market_to_string(market))
            return market;
    }
    return std::nullopt;
}

const char* payload_key(EventType type) {
    switch (type) {
    case EventType::Candle:
        return "candle";
    case EventType::SwingPoint:
        return "swingPoint";
    case EventType::LiquidityExtreme:
        return "liquidityExtreme";
    case EventType::PlanZone:
        return "planZone";
    case EventType::TechnicalAnalysis:
        return "technicalAnalysis";
    case EventType::Order:
        return "order";
    default:
        return "payload";
    }
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

json candle_to_json(const market::Candle& candle) {
    return {{"timestamp", candle.timestamp}, {"open", candle.open},     {"high", candle.high},
            {"low", candle.low},             {"close", candle.close},   {"volume", candle.volume},
            {"durationMs", candle.duration_ms}};
}

json swing_point_to_json(const zones::SwingPoint& swing) {
    return {{"timestamp", swing.timestamp},
            {"price", swing.price},
            {"kind", zones::swing_kind_to_string(swing.kind)},
            {"direction", direction_to_string(swing.direction)}};
}

json liquidity_extreme_to_json(const zones::LiquidityExtreme& extreme) {
    return {{"market", util::market_to_string(extreme.market)},
            {"kind", zones::extreme_kind_to_string(extreme.kind)},
            {"level", extreme.level},
            {"startTimestamp", extreme.start_timestamp},
            {"endTimestamp", optional_to_json(extreme.end_timestamp)}};
}

json plan_zone_to_json(const zones::PlanZone& zone) {
    return {{"kind", zones::plan_zone_kind_to_string(zone.kind)},
            {"low", zone.low},
            {"high", zone.high},
            {"startTimestamp", zone.start_timestamp},
            {"endTimestamp", optional_to_json(zone.end_timestamp)}};
}

json technical_analysis_to_json(const analysis::TechnicalAnalysis& row) {
    const auto& t = row.trend;
    const auto& m = row.momentum;
    const auto& v = row.volatility;
    const auto& vol = row.volume;

    json trend = {{"sma", t.sma},
                  {"ema", t.ema},
                  {"tma", t.tma},
                  {"shortTermMA", t.short_term_ma},
                  {"longTermMA", t.long_term_ma},
                  {"plusDI", t.plus_di},
                  {"minusDI", t.minus_di},
                  {"adx", t.adx},
                  {"goldenCross", t.is_golden_cross()},
                  {"direction", direction_to_string(t.direction())}};

    json momentum = {{"rsi", m.rsi},
                     {"stochasticsK", m.stochastics.k},
                     {"stochasticsD", m.stochastics.d},
                     {"williamsR", m.williams_r},
                     {"cci", m.cci},
                     {"state", analysis::momentum_state_to_string(m.overall_momentum())}};

    json volatility = {
        {"currentTR", v.true_range.current_tr},
        {"atr", v.true_range.atr},
        {"atrTrend", analysis::trend_change_to_string(v.true_range.atr_trend)},
        {"level", analysis::volatility_level_to_string(v.true_range.level)},
        {"keltnerChannel", {{"upper", v.keltner.upper}, {"center", v.keltner.center}, {"lower", v.keltner.lower}}},
        {"bollingerBand",
         {{"upper", v.bollinger.upper},
          {"center", v.bollinger.center},
          {"lower", v.bollinger.lower},
          {"percentB", v.bollinger.percent_b},
          {"bandwidth", v.bollinger.bandwidth}}},
        {"stdDevBands",
         {{"mean", v.std_dev.mean},
          {"stdDev", v.std_dev.std_dev},
          {"oneUpper", v.std_dev.one_upper},
          {"oneLower", v.std_dev.one_lower},
          {"twoUpper", v.std_dev.two_upper},
          {"twoLower", v.std_dev.two_lower},
          {"level", v.std_dev.level}}}};

    json levels = json::array();
    for (const auto& level : vol.profile.levels)
        levels.push_back({{"price", level.price}, {"volume", level.volume}});

    json volume = {{"volumeProfile",
                    {{"levels", std::move(levels)},
                     {"pointOfControl", vol.profile.poc_price},
                     {"valueAreaHigh", vol.profile.value_area_high},
                     {"valueAreaLow", vol.profile.value_area_low}}},
                   {"vwap", vol.vwap.vwap},
                   {"vwapSlope", vol.vwap.slope},
                   {"relativeVolume", vol.relative_volume},
                   {"volumeTrend", analysis::trend_change_to_string(vol.volume_trend)},
                   {"onBalanceVolume", vol.on_balance_volume},
                   {"volumePriceTrend", vol.volume_price_trend}};

    return {{"timestamp", row.timestamp},
            {"trend", std::move(trend)},
            {"momentum", std::move(momentum)},
            {"volatility", std::move(volatility)},
            {"volume", std::move(volume)}};
}

json order_to_json(const order::Order& o) {
    json j = {{"id", o.id},
              {"timestamp", o.timestamp},
              {"orderType", order_type_to_string(o.type)},
              {"low", o.low},
              {"high", o.high},
              {"entryPrice", o.entry_price()},
              {"stopLoss", o.stop_loss()},
              {"takeProfit", o.take_profit()},
              {"profitMultiplier", o.profit_multiplier},
              {"riskMultiplier", o.risk_multiplier},
              {"status", order::order_status_to_string(o.status)},
              {"entryStrategy", o.entry_strategy},
              {"regime", o.regime},
              {"score", o.score},
              {"placedTimestamp", optional_to_json(o.placed_timestamp)},
              {"filledTimestamp", optional_to_json(o.filled_timestamp)},
              {"closeTimestamp", optional_to_json(o.close_timestamp)},
              {"exitPrice", optional_to_json(o.exit_price)},
              {"trailStop", optional_to_json(o.trail_stop)},
              {"contract", o.contract},
              {"contracts", o.contracts}};
    if (!o.cancel_reason.empty())
        j["cancelReason"] = o.cancel_reason;
    if (o.broker_order_id)
        j["brokerOrderId"] = *o.broker_order_id;
    if (!o.last_broker_error.empty())
        j["lastBrokerError"] = o.last_broker_error;
    return j;
}

json event_to_json(const Event& event) {
    json j = {{"eventType", event_type_to_string(event.type())},
              {"timestamp", event.timestamp},
              {"phase", phase_to_string(event.phase)},
              {"tradingDate", event.trading_day.ok() ? util::format_date(event.trading_day) : std::string()}};

    j[payload_key(event.type())] = std::visit(
        [](const auto& payload) -> json {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, market::Candle>)
                return candle_to_json(payload);
            else if constexpr (std::is_same_v<T, zones::SwingPoint>)
                return swing_point_to_json(payload);
            else if constexpr (std::is_same_v<T, zones::LiquidityExtreme>)
                return liquidity_extreme_to_json(payload);
            else if constexpr (std::is_same_v<T, zones::PlanZone>)
                return plan_zone_to_json(payload);
            else if constexpr (std::is_same_v<T, analysis::TechnicalAnalysis>)
                return technical_analysis_to_json(payload);
            else
                return order_to_json(payload);
        },
        event.payload);
    return j;
}

std::string serialize_event(const Event& event) { return event_to_json(event).dump(); }

// ============================================================================
// Decoding
// ============================================================================

std::optional<market::Candle> candle_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    market::Candle c;
    if (!read(j, "timestamp", c.timestamp) || !read(j, "open", c.open) || !read(j, "high", c.high) ||
        !read(j, "low", c.low) || !read(j, "close", c.close) || !read(j, "volume", c.volume))
        return std::nullopt;
    read(j, "durationMs", c.duration_ms);
    return c;
}

std::optional<zones::SwingPoint> swing_point_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    zones::SwingPoint s;
    std::string kind;
    if (!read(j, "timestamp", s.timestamp) || !read(j, "price", s.price) || !read(j, "kind", kind))
        return std::nullopt;
    if (kind == "High") {
        s.kind = zones::SwingKind::High;
        s.direction = Direction::Down;
    } else if (kind == "Low") {
        s.kind = zones::SwingKind::Low;
        s.direction = Direction::Up;
    } else {
        return std::nullopt;
    }
    return s;
}

std::optional<zones::LiquidityExtreme> liquidity_extreme_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    zones::LiquidityExtreme e;
    std::string market;
    std::string kind;
    if (!read(j, "market", market) || !read(j, "kind", kind) || !read(j, "level", e.level) ||
        !read(j, "startTimestamp", e.start_timestamp))
        return std::nullopt;
    auto parsed_market = market_from_string(market);
    if (!parsed_market)
        return std::nullopt;
    e.market = *parsed_market;
    if (kind == "High")
        e.kind = zones::ExtremeKind::High;
    else if (kind == "Low")
        e.kind = zones::ExtremeKind::Low;
    else
        return std::nullopt;
    read_optional(j, "endTimestamp", e.end_timestamp);
    return e;
}

std::optional<zones::PlanZone> plan_zone_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    zones::PlanZone z;
    std::string kind;
    if (!read(j, "kind", kind) || !read(j, "low", z.low) || !read(j, "high", z.high) ||
        !read(j, "startTimestamp", z.start_timestamp))
        return std::nullopt;
    if (kind == "Demand")
        z.kind = zones::PlanZoneKind::Demand;
    else if (kind == "Supply")
        z.kind = zones::PlanZoneKind::Supply;
    else
        return std::nullopt;
    read_optional(j, "endTimestamp", z.end_timestamp);
    return z;
}

std::optional<order::Order> order_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    order::Order o;
    std::string type;
    std::string status;
    if (!read(j, "timestamp", o.timestamp) || !read(j, "orderType", type) || !read(j, "low", o.low) ||
        !read(j, "high", o.high) || !read(j, "status", status))
        return std::nullopt;
    auto parsed_type = order_type_from_string(type);
    auto parsed_status = order_status_from_string(status);
    if (!parsed_type || !parsed_status)
        return std::nullopt;
    o.type = *parsed_type;
    o.status = *parsed_status;

    read(j, "id", o.id);
    read(j, "profitMultiplier", o.profit_multiplier);
    read(j, "riskMultiplier", o.risk_multiplier);
    read(j, "entryStrategy", o.entry_strategy);
    read(j, "regime", o.regime);
    read(j, "score", o.score);
    read_optional(j, "placedTimestamp", o.placed_timestamp);
    read_optional(j, "filledTimestamp", o.filled_timestamp);
    read_optional(j, "closeTimestamp", o.close_timestamp);
    read_optional(j, "exitPrice", o.exit_price);
    read_optional(j, "trailStop", o.trail_stop);
    read(j, "cancelReason", o.cancel_reason);
    read(j, "contract", o.contract);
    read(j, "contracts", o.contracts);
    read_optional(j, "brokerOrderId", o.broker_order_id);
    read(j, "lastBrokerError", o.last_broker_error);
    return o;
}

std::optional<Event> event_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    std::string type;
    std::string phase_name;
    Timestamp timestamp = 0;
    if (!read(j, "eventType", type) || !read(j, "phase", phase_name) || !read(j, "timestamp", timestamp))
        return std::nullopt;
    auto phase = phase_from_string(phase_name);
    if (!phase)
        return std::nullopt;

    util::Date trading_day{};
    std::string date_text;
    if (read(j, "tradingDate", date_text)) {
        if (auto parsed = util::parse_date(date_text))
            trading_day = *parsed;
    }

    auto payload_of = [&](EventType t) -> const json& {
        static const json empty;
        auto it = j.find(payload_key(t));
        return it == j.end() ? empty : *it;
    };

    std::optional<EventPayload> payload;
    if (type == "Candle") {
        if (auto c = candle_from_json(payload_of(EventType::Candle)))
            payload = *c;
    } else if (type == "SwingPoint") {
        if (auto s = swing_point_from_json(payload_of(EventType::SwingPoint)))
            payload = *s;
    } else if (type == "LiquidityExtreme") {
        if (auto e = liquidity_extreme_from_json(payload_of(EventType::LiquidityExtreme)))
            payload = *e;
    } else if (type == "PlanZone") {
        if (auto z = plan_zone_from_json(payload_of(EventType::PlanZone)))
            payload = *z;
    } else if (type == "Order") {
        if (auto o = order_from_json(payload_of(EventType::Order)))
            payload = *o;
    }
    if (!payload)
        return std::nullopt;
    return Event::make(*phase, timestamp, trading_day, std::move(*payload));
}

} // namespace core
} // namespace zonetrader
