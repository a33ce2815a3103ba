#pragma once

#include "../order/order.hpp"
#include "../types.hpp"

#include <optional>
#include <string>

namespace zonetrader {
namespace broker {

enum class BrokerErrorKind : uint8_t {
    None = 0,
    Transient = 1,  // 429/503 after the retry budget was spent
    Definitive = 2, // any other 4xx/5xx or an explicit broker rejection
    Transport = 3,  // connection, TLS or timeout failure
    Parse = 4,      // 2xx with a body we could not read
    Pending = 5,    // queued on the broker thread; repeat the call for its result
};

inline const char* broker_error_kind_to_string(BrokerErrorKind kind) {
    switch (kind) {
    case BrokerErrorKind::None:
        return "None";
    case BrokerErrorKind::Transient:
        return "Transient";
    case BrokerErrorKind::Definitive:
        return "Definitive";
    case BrokerErrorKind::Transport:
        return "Transport";
    case BrokerErrorKind::Parse:
        return "Parse";
    case BrokerErrorKind::Pending:
        return "Pending";
    default:
        return "Unknown";
    }
}

struct BrokerResult {
    BrokerErrorKind error = BrokerErrorKind::None;
    std::string message;
    int http_status = 0;
    int attempts = 0;

    // Filled in by a successful bracket placement
    std::optional<int64_t> broker_order_id;
    std::optional<int64_t> profit_leg_id;
    std::optional<int64_t> stop_leg_id;

    bool ok() const { return error == BrokerErrorKind::None; }
    bool pending() const { return error == BrokerErrorKind::Pending; }

    static BrokerResult failure(BrokerErrorKind kind, std::string msg, int status = 0, int attempts = 1) {
        BrokerResult r;
        r.error = kind;
        r.message = std::move(msg);
        r.http_status = status;
        r.attempts = attempts;
        return r;
    }
};

/**
 * The broker's view of one bracket order, mapped onto the local status set.
 */
struct BrokerOrderReport {
    order::OrderStatus status = order::OrderStatus::Placed;
    std::optional<Price> entry_fill_price;
    std::optional<Timestamp> entry_fill_timestamp;
    std::optional<Price> exit_price;
    std::optional<Timestamp> exit_timestamp;
};

/**
 * IBrokerGateway - one seam for simulated and remote execution
 *
 * Implementations never throw for broker-side problems; every outcome is
 * reported through BrokerResult so the lifecycle can attach it to the order.
 */
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual const char* name() const = 0;

    /// True when fills and exits are derived from candles rather than reported by a venue
    virtual bool simulates_fills() const = 0;

    /// Entry with take-profit and stop-loss as one one-sends-other request
    virtual BrokerResult place_bracket(const order::Order& order) = 0;

    virtual BrokerResult cancel_order(const order::Order& order) = 0;

    /// Flatten the position opened by a filled order
    virtual BrokerResult liquidate(const order::Order& order) = 0;

    virtual BrokerResult query_order(const order::Order& order, BrokerOrderReport& report) = 0;

    virtual std::optional<double> account_balance() = 0;

    /// Notified once when an order reaches a terminal state
    virtual void on_order_closed(const order::Order& /*order*/) {}
};

} // namespace broker
} // namespace zonetrader
