#pragma once

#include "../broker/broker_gateway.hpp"
#include "../logging/async_logger.hpp"
#include "../market/candle.hpp"
#include "../util/market_calendar.hpp"
#include "order.hpp"

#include <unordered_set>
#include <vector>

namespace zonetrader {
namespace order {

struct LifecycleConfig {
    Timestamp unfilled_timeout_ms = 2 * MS_PER_MINUTE; // cancel entries not reached in time
    bool flatten_at_end_of_day = true;
};

/**
 * OrderLifecycle - drives every open order through one candle
 *
 * Rules run in a fixed order per order: end of day, place, fill, stop,
 * target, unfilled timeout. Against a simulating gateway fills and exits
 * come from the candle; against a remote gateway they come from the
 * broker's report, which overrides local state.
 *
 * Broker failures never throw out of apply(): a definitive rejection
 * cancels the order with the broker's message, anything else is recorded
 * in last_broker_error and the order keeps its state.
 *
 * A Pending answer (the gateway runs the call on another thread) changes
 * nothing; the same call is repeated on the next candle to collect the
 * result. A Planned order whose placement is pending is neither expired
 * nor cancelled locally, since the broker may already hold its bracket.
 */
class OrderLifecycle {
public:
    OrderLifecycle(broker::IBrokerGateway& gateway, const LifecycleConfig& config = LifecycleConfig{},
                   logging::AsyncLogger* logger = nullptr)
        : gateway_(gateway), config_(config), logger_(logger) {}

    /**
     * Apply one candle. Returns the post-change copy of every order whose
     * state moved.
     */
    std::vector<Order> apply(std::vector<Order>& orders, const market::Candle& candle) {
        std::vector<Order> changed;
        for (auto& order : orders) {
            if (!order.is_active())
                continue;
            Order before = order;
            step(order, candle);
            if (!(order == before)) {
                changed.push_back(order);
                if (!order.is_active()) {
                    placing_.erase(order.id);
                    gateway_.on_order_closed(order);
                }
            }
        }
        return changed;
    }

    // Long limit entries wait for price above the entry, Short below
    static bool ready_to_place(const Order& order, const market::Candle& candle) {
        if (order.status != OrderStatus::Planned)
            return false;
        return order.type == OrderType::Long ? candle.close > order.entry_price()
                                             : candle.close < order.entry_price();
    }

    static bool hit_entry(const Order& order, const market::Candle& candle) {
        if (order.status != OrderStatus::Placed)
            return false;
        return order.type == OrderType::Long ? candle.low <= order.entry_price()
                                             : candle.high >= order.entry_price();
    }

    // When one candle touches both legs its colour decides which came first
    static bool hit_stop(const Order& order, const market::Candle& candle) {
        bool stop = touches_stop(order, candle);
        if (stop && touches_target(order, candle))
            return order.type == OrderType::Long ? candle.is_bullish() : candle.is_bearish();
        return stop;
    }

    static bool hit_target(const Order& order, const market::Candle& candle) {
        bool target = touches_target(order, candle);
        if (target && touches_stop(order, candle)) {
            return order.type == OrderType::Long ? (candle.is_bearish() || candle.is_doji())
                                                 : (candle.is_bullish() || candle.is_doji());
        }
        return target;
    }

    const LifecycleConfig& config() const { return config_; }

    bool placement_pending(const Order& order) const { return placing_.count(order.id) > 0; }

private:
    broker::IBrokerGateway& gateway_;
    LifecycleConfig config_;
    logging::AsyncLogger* logger_;
    std::unordered_set<OrderId> placing_;

    bool pending(const broker::BrokerResult& result, const Order& order, const char* call) const {
        if (!result.pending())
            return false;
        LOGF_DEBUG(logger_, logging::LogCategory::Order, "order %llu %s pending",
                   static_cast<unsigned long long>(order.id), call);
        return true;
    }

    void step(Order& order, const market::Candle& candle) {
        if (util::is_end_of_day(candle.timestamp)) {
            end_of_day(order, candle);
            return;
        }

        place(order, candle);

        if (gateway_.simulates_fills()) {
            if (hit_entry(order, candle))
                apply_transition(order, OrderStatus::Filled, candle.end_time());
            if (hit_stop(order, candle))
                close_at(order, order.stop_loss(), candle.end_time());
            else if (hit_target(order, candle))
                close_at(order, order.take_profit(), candle.end_time());
        } else if (order.is_working()) {
            reconcile(order, candle);
        }

        cancel_unfilled(order, candle);
    }

    static bool touches_stop(const Order& order, const market::Candle& candle) {
        if (order.status != OrderStatus::Filled || candle.end_time() < order.filled_timestamp.value_or(0))
            return false;
        return order.type == OrderType::Long ? candle.low <= order.stop_loss() : candle.high >= order.stop_loss();
    }

    static bool touches_target(const Order& order, const market::Candle& candle) {
        if (order.status != OrderStatus::Filled || candle.end_time() < order.filled_timestamp.value_or(0))
            return false;
        return order.type == OrderType::Long ? candle.high >= order.take_profit()
                                             : candle.low <= order.take_profit();
    }

    void place(Order& order, const market::Candle& candle) {
        if (order.status != OrderStatus::Planned)
            return;
        if (!ready_to_place(order, candle) && !placement_pending(order))
            return;

        broker::BrokerResult result = gateway_.place_bracket(order);
        if (pending(result, order, "placement")) {
            placing_.insert(order.id);
            return;
        }
        placing_.erase(order.id);
        if (result.ok()) {
            order.broker_order_id = result.broker_order_id;
            order.broker_profit_leg_id = result.profit_leg_id;
            order.broker_stop_leg_id = result.stop_leg_id;
            order.last_broker_error.clear();
            apply_transition(order, OrderStatus::Placed, candle.end_time());
            LOGF_INFO(logger_, logging::LogCategory::Order, "order %llu placed %s entry=%.2f stop=%.2f target=%.2f",
                      static_cast<unsigned long long>(order.id), order_type_to_string(order.type),
                      order.entry_price(), order.stop_loss(), order.take_profit());
            return;
        }

        order.last_broker_error = result.message;
        if (result.error == broker::BrokerErrorKind::Definitive) {
            order.cancel_reason = result.message.empty() ? CancelReason::BrokerRejected : result.message;
            apply_transition(order, OrderStatus::Cancelled, candle.end_time());
            LOGF_WARN(logger_, logging::LogCategory::Order, "order %llu rejected: %s",
                      static_cast<unsigned long long>(order.id), result.message.c_str());
        } else {
            // Stays Planned; the unfilled timeout retires it if the broker never recovers
            LOGF_WARN(logger_, logging::LogCategory::Order, "order %llu not placed (%s): %s",
                      static_cast<unsigned long long>(order.id), broker::broker_error_kind_to_string(result.error),
                      result.message.c_str());
        }
    }

    void reconcile(Order& order, const market::Candle& candle) {
        broker::BrokerOrderReport report;
        broker::BrokerResult result = gateway_.query_order(order, report);
        if (pending(result, order, "status query"))
            return;
        if (!result.ok()) {
            order.last_broker_error = result.message;
            LOGF_WARN(logger_, logging::LogCategory::Order, "order %llu status query failed: %s",
                      static_cast<unsigned long long>(order.id), result.message.c_str());
            return;
        }
        if (report.status == order.status)
            return;

        Timestamp at = candle.end_time();
        if (report.status == OrderStatus::Filled && report.entry_fill_timestamp)
            at = *report.entry_fill_timestamp;
        if (is_terminal(report.status) && report.exit_timestamp)
            at = *report.exit_timestamp;

        OrderStatus from = order.status;
        TransitionResult applied = order.reconcile_to(report.status, at);
        if (applied != TransitionResult::Applied) {
            LOGF_WARN(logger_, logging::LogCategory::Order, "order %llu broker reports %s while local is %s (%s)",
                      static_cast<unsigned long long>(order.id), order_status_to_string(report.status),
                      order_status_to_string(from), transition_result_to_string(applied));
            return;
        }
        if (is_terminal(report.status) && report.exit_price)
            order.exit_price = report.exit_price;
        if (report.status == OrderStatus::Cancelled && order.cancel_reason.empty())
            order.cancel_reason = "Cancelled by broker.";
        LOGF_INFO(logger_, logging::LogCategory::Order, "order %llu reconciled %s -> %s",
                  static_cast<unsigned long long>(order.id), order_status_to_string(from),
                  order_status_to_string(report.status));
    }

    void cancel_unfilled(Order& order, const market::Candle& candle) {
        if (order.status == OrderStatus::Planned) {
            if (!placement_pending(order) && candle.end_time() >= order.timestamp + config_.unfilled_timeout_ms) {
                order.cancel_reason = CancelReason::NotFilled;
                apply_transition(order, OrderStatus::Cancelled, candle.end_time());
            }
            return;
        }
        if (order.status != OrderStatus::Placed || !order.placed_timestamp)
            return;
        if (candle.end_time() < *order.placed_timestamp + config_.unfilled_timeout_ms)
            return;

        broker::BrokerResult result = gateway_.cancel_order(order);
        if (pending(result, order, "cancel"))
            return;
        if (!result.ok()) {
            order.last_broker_error = result.message;
            LOGF_WARN(logger_, logging::LogCategory::Order, "order %llu cancel failed: %s",
                      static_cast<unsigned long long>(order.id), result.message.c_str());
            return;
        }
        order.cancel_reason = CancelReason::NotFilled;
        apply_transition(order, OrderStatus::Cancelled, candle.end_time());
    }

    void end_of_day(Order& order, const market::Candle& candle) {
        if (placement_pending(order)) {
            // Collect the placement first so a bracket the broker accepted is cancelled there
            place(order, candle);
            if (order.status == OrderStatus::Planned && placement_pending(order))
                return;
        }
        switch (order.status) {
        case OrderStatus::Planned:
            order.cancel_reason = CancelReason::EndOfDay;
            apply_transition(order, OrderStatus::Cancelled, candle.end_time());
            break;
        case OrderStatus::Placed: {
            broker::BrokerResult result = gateway_.cancel_order(order);
            if (pending(result, order, "cancel"))
                return;
            if (!result.ok()) {
                order.last_broker_error = result.message;
                return;
            }
            order.cancel_reason = CancelReason::EndOfDay;
            apply_transition(order, OrderStatus::Cancelled, candle.end_time());
            break;
        }
        case OrderStatus::Filled: {
            if (!config_.flatten_at_end_of_day)
                return;
            broker::BrokerResult result = gateway_.liquidate(order);
            if (pending(result, order, "liquidation"))
                return;
            if (!result.ok()) {
                order.last_broker_error = result.message;
                LOGF_ERROR(logger_, logging::LogCategory::Order, "order %llu liquidation failed: %s",
                           static_cast<unsigned long long>(order.id), result.message.c_str());
                return;
            }
            close_at(order, candle.close, candle.end_time());
            break;
        }
        default:
            break;
        }
    }

    // Exit a filled order; the sign of the realized move picks Profit or Loss
    void close_at(Order& order, Price exit_price, Timestamp at) {
        if (order.status != OrderStatus::Filled)
            return;
        double points = order.type == OrderType::Long ? exit_price - order.entry_price()
                                                      : order.entry_price() - exit_price;
        OrderStatus outcome = points >= 0 ? OrderStatus::Profit : OrderStatus::Loss;
        if (apply_transition(order, outcome, at))
            order.exit_price = exit_price;
    }

    bool apply_transition(Order& order, OrderStatus next, Timestamp at) {
        TransitionResult result = order.transition(next, at);
        if (result != TransitionResult::Applied) {
            LOGF_ERROR(logger_, logging::LogCategory::Order, "order %llu %s -> %s refused: %s",
                       static_cast<unsigned long long>(order.id), order_status_to_string(order.status),
                       order_status_to_string(next), transition_result_to_string(result));
            return false;
        }
        return true;
    }
};

} // namespace order
} // namespace zonetrader
