#pragma once

#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace zonetrader {
namespace order {

enum class OrderStatus : uint8_t { Planned = 0, Placed = 1, Filled = 2, Profit = 3, Loss = 4, Cancelled = 5 };

inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
    case OrderStatus::Planned:
        return "Planned";
    case OrderStatus::Placed:
        return "Placed";
    case OrderStatus::Filled:
        return "Filled";
    case OrderStatus::Profit:
        return "Profit";
    case OrderStatus::Loss:
        return "Loss";
    case OrderStatus::Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}

inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::Profit || status == OrderStatus::Loss || status == OrderStatus::Cancelled;
}

// Position along Planned -> Placed -> Filled -> {Profit, Loss}; Cancelled sits beside Filled
inline int status_rank(OrderStatus status) {
    switch (status) {
    case OrderStatus::Planned:
        return 0;
    case OrderStatus::Placed:
        return 1;
    case OrderStatus::Filled:
        return 2;
    default:
        return 3;
    }
}

enum class TransitionResult : uint8_t {
    Applied = 0,
    IllegalTransition = 1, // backward, sideways, or skipping a state
    AlreadyTerminal = 2,
    TimestampRegression = 3, // placed <= filled <= closed would be violated
};

inline const char* transition_result_to_string(TransitionResult result) {
    switch (result) {
    case TransitionResult::Applied:
        return "Applied";
    case TransitionResult::IllegalTransition:
        return "IllegalTransition";
    case TransitionResult::AlreadyTerminal:
        return "AlreadyTerminal";
    case TransitionResult::TimestampRegression:
        return "TimestampRegression";
    default:
        return "Unknown";
    }
}

namespace CancelReason {
constexpr const char* FullCandleOutside = "Full candle outside of zone.";
constexpr const char* TenMinuteWickOutside = "Ten minute candle wick outside of zone.";
constexpr const char* EndOfDay = "Ten minutes until closing. All orders cancelled.";
constexpr const char* NotFilled = "Entry not reached within two minutes.";
constexpr const char* BrokerRejected = "Broker rejected the order.";
} // namespace CancelReason

// Micro contract pays $5 per point; 10 micros convert to one full contract
constexpr double DOLLARS_PER_MICRO_POINT = 5.0;
constexpr int MICROS_PER_FULL = 10;
constexpr double DEFAULT_PROFIT_MULTIPLIER = 2.5;
constexpr double DEFAULT_RISK_DOLLARS = 1000.0; // dollars at risk for risk_multiplier 1.0

struct ContractSizing {
    std::string contract; // "ES" or "MES"
    int contracts = 0;
};

/**
 * Contracts for a stop distance so that a full stop costs roughly risk_dollars.
 */
inline ContractSizing determine_contracts(double risk_dollars, double at_risk_points) {
    if (at_risk_points <= 0)
        return {"MES", 0};
    int micros = static_cast<int>(std::floor(risk_dollars / (at_risk_points * DOLLARS_PER_MICRO_POINT)));
    if (micros >= MICROS_PER_FULL)
        return {"ES", static_cast<int>(std::lround(static_cast<double>(micros) / MICROS_PER_FULL))};
    return {"MES", micros};
}

inline double point_value(const std::string& contract) { return contract == "ES" ? 50.0 : DOLLARS_PER_MICRO_POINT; }

/**
 * Order - bracket trade built from a [low, high] price band
 *
 * Long enters at high with the stop at low; Short enters at low with the
 * stop at high. The target sits profit_multiplier times the risk beyond
 * the entry. Status only moves forward and the placed/filled/closed
 * timestamps are monotonic.
 */
struct Order {
    OrderId id = INVALID_ORDER_ID;
    Timestamp timestamp = 0; // creation candle
    OrderType type = OrderType::Long;
    Price low = 0;
    Price high = 0;
    double profit_multiplier = DEFAULT_PROFIT_MULTIPLIER;
    double risk_multiplier = 1.0;

    OrderStatus status = OrderStatus::Planned;
    std::string entry_strategy;
    std::string regime;
    double score = 0;

    std::optional<Timestamp> placed_timestamp;
    std::optional<Timestamp> filled_timestamp;
    std::optional<Timestamp> close_timestamp;
    std::optional<Price> exit_price;
    std::optional<Price> trail_stop;
    std::string cancel_reason;

    std::string contract = "MES";
    int contracts = 0;

    // Broker bookkeeping
    std::optional<int64_t> broker_order_id;
    std::optional<int64_t> broker_profit_leg_id;
    std::optional<int64_t> broker_stop_leg_id;
    std::string last_broker_error;

    static Order from_band(OrderId id, Timestamp timestamp, OrderType type, Price low, Price high,
                           double profit_multiplier = DEFAULT_PROFIT_MULTIPLIER, double risk_multiplier = 1.0) {
        Order o;
        o.id = id;
        o.timestamp = timestamp;
        o.type = type;
        o.low = low;
        o.high = high;
        o.profit_multiplier = profit_multiplier;
        o.risk_multiplier = risk_multiplier;
        ContractSizing sizing = determine_contracts(DEFAULT_RISK_DOLLARS * risk_multiplier, o.at_risk_points());
        o.contract = sizing.contract;
        o.contracts = sizing.contracts;
        return o;
    }

    Price entry_price() const { return type == OrderType::Long ? high : low; }
    Price stop_loss() const { return type == OrderType::Long ? low : high; }
    Price at_risk_points() const { return high - low; }
    Price potential_profit_points() const { return at_risk_points() * profit_multiplier; }

    Price take_profit() const {
        return type == OrderType::Long ? high + potential_profit_points() : low - potential_profit_points();
    }

    bool is_active() const { return !is_terminal(status); }
    bool is_working() const { return status == OrderStatus::Placed || status == OrderStatus::Filled; }

    // Signed points from entry to exit in the trade's favour
    double realized_points() const {
        if (!exit_price)
            return 0;
        return type == OrderType::Long ? *exit_price - entry_price() : entry_price() - *exit_price;
    }

    /**
     * R-multiple of a closed trade: +profit_multiplier for a full target,
     * -1 for a full stop, proportional for a flatten at the close.
     */
    double r_multiple() const {
        if (status == OrderStatus::Cancelled || !is_terminal(status))
            return 0;
        if (exit_price && at_risk_points() > 0)
            return realized_points() / at_risk_points();
        return status == OrderStatus::Profit ? profit_multiplier : -1.0;
    }

    double dollar_pnl() const { return r_multiple() * at_risk_points() * point_value(contract) * contracts; }

    /**
     * Strict forward step: Planned->Placed, Placed->Filled, Placed->Cancelled,
     * Planned->Cancelled, Filled->Profit, Filled->Loss.
     */
    TransitionResult transition(OrderStatus next, Timestamp at) {
        if (is_terminal(status))
            return TransitionResult::AlreadyTerminal;
        if (!legal_step(status, next))
            return TransitionResult::IllegalTransition;
        if (at < latest_timestamp())
            return TransitionResult::TimestampRegression;
        stamp(next, at);
        status = next;
        return TransitionResult::Applied;
    }

    /**
     * Apply a broker-reported state. The broker's view wins, so forward skips
     * (Planned straight to Filled) are allowed; backward moves never are.
     * Skipped timestamps are filled in with `at`.
     */
    TransitionResult reconcile_to(OrderStatus reported, Timestamp at) {
        if (reported == status)
            return TransitionResult::Applied;
        if (is_terminal(status))
            return TransitionResult::AlreadyTerminal;
        if (status_rank(reported) <= status_rank(status))
            return TransitionResult::IllegalTransition;
        Timestamp when = std::max(at, latest_timestamp());
        if (reported != OrderStatus::Cancelled) {
            if (!placed_timestamp)
                placed_timestamp = when;
            if (status_rank(reported) >= status_rank(OrderStatus::Filled) && !filled_timestamp)
                filled_timestamp = when;
        }
        stamp(reported, when);
        status = reported;
        return TransitionResult::Applied;
    }

    Timestamp latest_timestamp() const {
        if (close_timestamp)
            return *close_timestamp;
        if (filled_timestamp)
            return *filled_timestamp;
        if (placed_timestamp)
            return *placed_timestamp;
        return timestamp;
    }

    bool operator==(const Order& other) const = default;

private:
    static bool legal_step(OrderStatus from, OrderStatus to) {
        switch (from) {
        case OrderStatus::Planned:
            return to == OrderStatus::Placed || to == OrderStatus::Cancelled;
        case OrderStatus::Placed:
            return to == OrderStatus::Filled || to == OrderStatus::Cancelled;
        case OrderStatus::Filled:
            return to == OrderStatus::Profit || to == OrderStatus::Loss;
        default:
            return false;
        }
    }

    void stamp(OrderStatus next, Timestamp at) {
        switch (next) {
        case OrderStatus::Placed:
            placed_timestamp = at;
            break;
        case OrderStatus::Filled:
            filled_timestamp = at;
            break;
        case OrderStatus::Profit:
        case OrderStatus::Loss:
        case OrderStatus::Cancelled:
            close_timestamp = at;
            break;
        default:
            break;
        }
    }
};

} // namespace order
} // namespace zonetrader
