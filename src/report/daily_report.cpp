#include "../../include/report/daily_report.hpp"
#include "../../include/core/event_json.hpp"

namespace zonetrader {
namespace report {

json report_to_json(const OrderReport& report) {
    json orders = json::array();
    for (const auto& o : report.orders)
        orders.push_back(core::order_to_json(o));

    json strategies = json::array();
    for (const auto& s : report.strategies) {
        strategies.push_back({{"entryStrategy", s.entry_strategy},
                              {"wins", s.wins},
                              {"losses", s.losses},
                              {"winRate", s.win_rate()},
                              {"totalR", s.total_r}});
    }

    json j = {{"orders", std::move(orders)},
              {"winning", report.winning},
              {"losing", report.losing},
              {"cancelled", report.cancelled},
              {"winRate", report.win_rate()},
              {"totalR", report.total_r},
              {"averageWinDollars", report.average_win_dollars},
              {"averageLossDollars", report.average_loss_dollars},
              {"maxDrawdownDollars", report.max_drawdown_dollars},
              {"totalFees", report.total_fees},
              {"totalPnL", report.total_pnl},
              {"netPnL", report.net_pnl()},
              {"winRates", std::move(strategies)}};

    auto profitable = report.profitable();
    j["profitable"] = profitable ? json(*profitable) : json(nullptr);
    return j;
}

} // namespace report
} // namespace zonetrader
