#pragma once

#include "../order/order.hpp"

#include <algorithm>
#include <cmath>
#include <span>
#include <vector>

namespace zonetrader {
namespace strategy {

struct RiskSizingConfig {
    double severe_drawdown = 18000.0;   // risk cut to 25%
    double moderate_drawdown = 15000.0; // risk cut to 50%
    double capped_drawdown = 10000.0;   // martingale capped at 2x
};

/**
 * RiskSizer - Kelly-style risk multiplier with drawdown caps
 *
 * Replays closed trades over the starting balance to estimate the account
 * value, derives base risk from it ($1000 of risk = multiplier 1.0), then
 * scales by a loss ladder since the last win, cut hard in drawdown.
 */
class RiskSizer {
public:
    explicit RiskSizer(const RiskSizingConfig& config = RiskSizingConfig{}) : config_(config) {}

    // Dollar risk for an account value
    static double risk_per_trade(double account_value) {
        if (account_value < 50000.0)
            return 500.0;
        if (account_value < 100000.0)
            return 1000.0;
        return std::floor(account_value / 100000.0) * 1000.0;
    }

    // Dollar result of a closed trade sized at `risk` dollars
    static double value_of(const order::Order& o, double risk) {
        order::ContractSizing sizing = order::determine_contracts(risk, o.at_risk_points());
        double dollars_at_risk = sizing.contracts * o.at_risk_points() * order::point_value(sizing.contract);
        if (o.status == order::OrderStatus::Profit)
            return dollars_at_risk * o.profit_multiplier;
        if (o.status == order::OrderStatus::Loss)
            return -dollars_at_risk;
        return 0;
    }

    /**
     * Multiplier for the next trade. `closed` holds Profit/Loss orders
     * oldest first; anything else is skipped.
     */
    double multiplier(std::span<const order::Order> closed, double starting_balance) const {
        double running = starting_balance;
        double peak = starting_balance;
        int trades = 0;
        int losses = 0; // since the last win, or since the first trade
        for (const auto& o : closed) {
            if (o.status != order::OrderStatus::Profit && o.status != order::OrderStatus::Loss)
                continue;
            running += value_of(o, risk_per_trade(running));
            peak = std::max(peak, running);
            ++trades;
            losses = o.status == order::OrderStatus::Profit ? 0 : losses + 1;
        }

        double base = risk_per_trade(running) / 1000.0;
        if (trades == 0)
            return base;

        double drawdown = peak - running;
        if (drawdown > config_.severe_drawdown)
            return base * 0.25;
        if (drawdown > config_.moderate_drawdown)
            return base * 0.5;

        double ladder;
        switch (losses) {
        case 0:
            ladder = 1.0;
            break;
        case 1:
            ladder = 2.0;
            break;
        case 2:
            ladder = 3.0;
            break;
        default:
            ladder = std::pow(0.5, losses - 2);
            break;
        }
        if (drawdown > config_.capped_drawdown)
            ladder = std::min(ladder, 2.0);
        return base * ladder;
    }

private:
    RiskSizingConfig config_;
};

} // namespace strategy
} // namespace zonetrader
