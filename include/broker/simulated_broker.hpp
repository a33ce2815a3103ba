#pragma once

#include "broker_gateway.hpp"

#include <mutex>
#include <unordered_map>

namespace zonetrader {
namespace broker {

/**
 * SimulatedBroker - in-process venue for backtests, replays and paper mode
 *
 * Accepts every well-formed bracket and leaves fills to the candle rules of
 * the lifecycle. Tracks an account balance from closed trades, net of fees.
 */
class SimulatedBroker : public IBrokerGateway {
public:
    struct Config {
        double starting_balance = 50000.0;
        double fee_per_es_contract = 2.88;
        double fee_per_mes_contract = 0.87;
    };

    SimulatedBroker() : SimulatedBroker(Config{}) {}
    explicit SimulatedBroker(const Config& config) : config_(config), balance_(config.starting_balance) {}

    const char* name() const override { return "simulated"; }
    bool simulates_fills() const override { return true; }

    BrokerResult place_bracket(const order::Order& order) override {
        if (order.at_risk_points() <= 0)
            return BrokerResult::failure(BrokerErrorKind::Definitive, "Bracket has no risk distance");

        std::lock_guard<std::mutex> lock(mutex_);
        BrokerResult result;
        result.attempts = 1;
        result.broker_order_id = next_id_++;
        result.profit_leg_id = next_id_++;
        result.stop_leg_id = next_id_++;
        working_[*result.broker_order_id] = order.id;
        ++placed_count_;
        return result;
    }

    BrokerResult cancel_order(const order::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (order.status != order::OrderStatus::Placed)
            return BrokerResult::failure(BrokerErrorKind::Definitive, "Only placed orders can be cancelled");
        if (order.broker_order_id)
            working_.erase(*order.broker_order_id);
        ++cancelled_count_;
        BrokerResult result;
        result.attempts = 1;
        return result;
    }

    BrokerResult liquidate(const order::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (order.broker_order_id)
            working_.erase(*order.broker_order_id);
        BrokerResult result;
        result.attempts = 1;
        return result;
    }

    // Candle rules own the state; the venue has nothing newer to report
    BrokerResult query_order(const order::Order& order, BrokerOrderReport& report) override {
        report.status = order.status;
        report.exit_price = order.exit_price;
        report.exit_timestamp = order.close_timestamp;
        BrokerResult result;
        result.attempts = 1;
        return result;
    }

    std::optional<double> account_balance() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return balance_;
    }

    void on_order_closed(const order::Order& order) override {
        if (order.status == order::OrderStatus::Cancelled)
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        balance_ += order.dollar_pnl() - fees_for(order);
        if (order.broker_order_id)
            working_.erase(*order.broker_order_id);
    }

    double fees_for(const order::Order& order) const {
        double per_contract = order.contract == "ES" ? config_.fee_per_es_contract : config_.fee_per_mes_contract;
        return per_contract * order.contracts;
    }

    size_t placed_count() const { return placed_count_; }
    size_t cancelled_count() const { return cancelled_count_; }
    size_t working_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return working_.size();
    }

private:
    Config config_;
    mutable std::mutex mutex_;
    double balance_;
    int64_t next_id_ = 1;
    std::unordered_map<int64_t, OrderId> working_;
    size_t placed_count_ = 0;
    size_t cancelled_count_ = 0;
};

} // namespace broker
} // namespace zonetrader
