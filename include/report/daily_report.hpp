#pragma once

#include "../core/event.hpp"
#include "../order/order.hpp"
#include "event_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace zonetrader {
namespace report {

using json = nlohmann::json;

struct ReportConfig {
    double fee_per_es_contract = 2.88;  // round trip
    double fee_per_mes_contract = 0.87;
};

struct StrategyStats {
    std::string entry_strategy;
    int wins = 0;
    int losses = 0;
    double total_r = 0;

    int trades() const { return wins + losses; }
    double win_rate() const { return trades() > 0 ? static_cast<double>(wins) / trades() : 0.0; }
};

struct OrderReport {
    std::vector<order::Order> orders;
    int winning = 0;
    int losing = 0;
    int cancelled = 0;
    double total_r = 0;
    double average_win_dollars = 0;
    double average_loss_dollars = 0; // positive
    double max_drawdown_dollars = 0;
    double total_fees = 0;
    double total_pnl = 0; // gross
    std::vector<StrategyStats> strategies; // best win rate first

    double win_rate() const { return winning + losing > 0 ? static_cast<double>(winning) / (winning + losing) : 0.0; }
    double net_pnl() const { return total_pnl - total_fees; }

    // Gross P&L sign; empty for a flat day or no orders
    std::optional<bool> profitable() const {
        if (orders.empty() || total_pnl == 0)
            return std::nullopt;
        return total_pnl > 0;
    }
};

/**
 * Latest state of each order from a stream of events. Orders are identified
 * by their creation timestamp; the last event for a timestamp wins.
 */
inline std::vector<order::Order> orders_from_events(std::span<const core::Event> events) {
    std::map<Timestamp, order::Order> latest;
    for (const auto& event : events) {
        if (const auto* o = event.get<order::Order>())
            latest[o->timestamp] = *o;
    }
    std::vector<order::Order> orders;
    orders.reserve(latest.size());
    for (auto& [ts, o] : latest)
        orders.push_back(std::move(o));
    return orders;
}

inline double order_fees(const order::Order& o, const ReportConfig& config) {
    double per_contract = o.contract == "ES" ? config.fee_per_es_contract : config.fee_per_mes_contract;
    return per_contract * o.contracts;
}

inline OrderReport build_report(std::vector<order::Order> orders, const ReportConfig& config = ReportConfig{}) {
    OrderReport report;

    std::vector<const order::Order*> completed;
    for (const auto& o : orders) {
        if (o.status == order::OrderStatus::Profit || o.status == order::OrderStatus::Loss)
            completed.push_back(&o);
        else if (o.status == order::OrderStatus::Cancelled)
            ++report.cancelled;
    }
    std::stable_sort(completed.begin(), completed.end(), [](const order::Order* a, const order::Order* b) {
        return a->close_timestamp.value_or(0) < b->close_timestamp.value_or(0);
    });

    double win_dollars = 0;
    double loss_dollars = 0;
    double running = 0;
    double peak = 0;
    std::map<std::string, StrategyStats> by_strategy;

    for (const order::Order* o : completed) {
        double pnl = o->dollar_pnl();
        bool win = o->status == order::OrderStatus::Profit;
        if (win) {
            ++report.winning;
            win_dollars += pnl;
        } else {
            ++report.losing;
            loss_dollars += pnl;
        }
        report.total_r += o->r_multiple();
        report.total_fees += order_fees(*o, config);

        running += pnl;
        peak = std::max(peak, running);
        report.max_drawdown_dollars = std::max(report.max_drawdown_dollars, peak - running);

        StrategyStats& stats = by_strategy[o->entry_strategy];
        stats.entry_strategy = o->entry_strategy;
        (win ? stats.wins : stats.losses) += 1;
        stats.total_r += o->r_multiple();
    }

    report.average_win_dollars = report.winning > 0 ? win_dollars / report.winning : 0.0;
    report.average_loss_dollars = report.losing > 0 ? -loss_dollars / report.losing : 0.0;
    report.total_pnl = win_dollars + loss_dollars;

    for (auto& [name, stats] : by_strategy)
        report.strategies.push_back(stats);
    std::stable_sort(report.strategies.begin(), report.strategies.end(),
                     [](const StrategyStats& a, const StrategyStats& b) { return a.win_rate() > b.win_rate(); });

    report.orders = std::move(orders);
    return report;
}

json report_to_json(const OrderReport& report);

/**
 * ReportService - reports over the Trading phase of stored dates
 */
class ReportService {
public:
    explicit ReportService(const EventStore& store, const ReportConfig& config = ReportConfig{})
        : store_(store), config_(config) {}

    OrderReport daily(const util::Date& date) const {
        auto phase = store_.get(date, core::Phase::Trading);
        return build_report(orders_from_events(phase.events), config_);
    }

    OrderReport aggregate() const {
        std::vector<order::Order> all;
        for (const auto& date : store_.available_dates()) {
            auto orders = orders_from_events(store_.get(date, core::Phase::Trading).events);
            all.insert(all.end(), orders.begin(), orders.end());
        }
        return build_report(std::move(all), config_);
    }

    std::vector<std::pair<util::Date, std::optional<bool>>> dates_with_profitability() const {
        std::vector<std::pair<util::Date, std::optional<bool>>> result;
        for (const auto& date : store_.available_dates())
            result.emplace_back(date, daily(date).profitable());
        return result;
    }

private:
    const EventStore& store_;
    ReportConfig config_;
};

} // namespace report
} // namespace zonetrader
