#include "../../include/core/replay_coordinator.hpp"

#include <algorithm>

namespace zonetrader {
namespace core {

std::pair<Timestamp, Timestamp> ReplayCoordinator::plan_range(const util::Date& date, int days) const {
    if (days <= 0)
        days = config_.default_plan_days;
    util::Date first = util::MarketCalendar::trading_days_back(date, days);
    return {util::new_york_time(first, 9, 0), util::new_york_open(date) - 1};
}

RunOutcome ReplayCoordinator::plan(const util::Date& date, int days, const EventSink& sink, CancelFlag cancel,
                                   std::shared_ptr<const StreamSnapshot>* final_snapshot) {
    auto [start, end] = plan_range(date, days);
    LOGF_INFO(logger_, logging::LogCategory::Pipeline, "PLAN replay for %s over %d trading days",
              util::format_date(date).c_str(), days <= 0 ? config_.default_plan_days : days);

    EventPipeline pipeline(Phase::Planning, pipeline_config_, sink, logger_);
    pipeline.pin_trading_day(date);
    RunOutcome outcome = pipeline.run(minute_source_, start, end, std::move(cancel));
    if (final_snapshot)
        *final_snapshot = pipeline.snapshot();
    return outcome;
}

RunOutcome ReplayCoordinator::trade(const StreamSnapshot& snapshot, const util::Date& date, const EventSink& sink,
                                    CancelFlag cancel) {
    std::vector<zones::LiquidityExtreme> extremes = snapshot.active_extremes();
    std::vector<zones::PlanZone> plan_zones;
    for (const auto& zone : snapshot.plan_zones) {
        if (zone.is_active())
            plan_zones.push_back(zone);
    }
    std::stable_sort(extremes.begin(), extremes.end(), [](const auto& a, const auto& b) {
        return a.start_timestamp < b.start_timestamp;
    });
    std::stable_sort(plan_zones.begin(), plan_zones.end(), [](const auto& a, const auto& b) {
        return a.start_timestamp < b.start_timestamp;
    });

    Timestamp open = util::new_york_open(date);
    Timestamp earliest = open;
    for (const auto& e : extremes)
        earliest = std::min(earliest, e.start_timestamp);
    for (const auto& z : plan_zones)
        earliest = std::min(earliest, z.start_timestamp);
    Timestamp start = earliest - config_.trade_warmup_ms;
    Timestamp end = open - 1;

    LOGF_INFO(logger_, logging::LogCategory::Pipeline,
              "TRADE warm-up for %s: %zu extremes, %zu plan zones, %s to %s", util::format_date(date).c_str(),
              extremes.size(), plan_zones.size(), util::to_new_york_time_string(start).c_str(),
              util::to_new_york_time_string(end).c_str());

    size_t next_extreme = 0;
    size_t next_zone = 0;
    Timestamp last = start;
    auto cancelled = [&] { return cancel && cancel->load(std::memory_order_acquire); };

    five_minute_source_.stream(start, end, [&](const market::Candle& candle) {
        if (cancelled())
            return false;
        last = candle.timestamp;
        sink(Event::make(Phase::Trading, candle.timestamp, date, candle));
        while (next_extreme < extremes.size() && candle.timestamp >= extremes[next_extreme].start_timestamp) {
            sink(Event::make(Phase::Trading, candle.timestamp, date, extremes[next_extreme]));
            ++next_extreme;
        }
        while (next_zone < plan_zones.size() && candle.timestamp >= plan_zones[next_zone].start_timestamp) {
            sink(Event::make(Phase::Trading, candle.timestamp, date, plan_zones[next_zone]));
            ++next_zone;
        }
        return true;
    });

    if (cancelled())
        return RunOutcome::Cancelled;

    // Context whose start the candle data never reached still belongs to the client
    for (; next_extreme < extremes.size(); ++next_extreme) {
        last = std::max(last, extremes[next_extreme].start_timestamp);
        sink(Event::make(Phase::Trading, last, date, extremes[next_extreme]));
    }
    for (; next_zone < plan_zones.size(); ++next_zone) {
        last = std::max(last, plan_zones[next_zone].start_timestamp);
        sink(Event::make(Phase::Trading, last, date, plan_zones[next_zone]));
    }
    return RunOutcome::Completed;
}

RunOutcome ReplayCoordinator::backtest(const util::Date& date, int days, broker::IBrokerGateway& gateway,
                                       const EventSink& sink, CancelFlag cancel) {
    auto [start, open] = plan_range(date, days);
    open += 1;
    Timestamp close = util::new_york_close(date);
    LOGF_INFO(logger_, logging::LogCategory::Pipeline, "Backtest %s on %s broker", util::format_date(date).c_str(),
              gateway.name());

    bool emitting = false;
    EventPipeline pipeline(Phase::Trading, pipeline_config_, [&](const Event& event) {
        if (emitting)
            sink(event);
    }, logger_);
    pipeline.pin_trading_day(date);

    bool cancelled = false;
    minute_source_.stream(start, close, [&](const market::Candle& candle) {
        if (cancel && cancel->load(std::memory_order_acquire)) {
            cancelled = true;
            return false;
        }
        if (!emitting && candle.timestamp >= open) {
            pipeline.attach_broker(&gateway);
            emitting = true;
        }
        pipeline.process(candle);
        return true;
    });

    if (cancelled) {
        LOGF_INFO(logger_, logging::LogCategory::Pipeline, "Backtest %s cancelled", util::format_date(date).c_str());
        return RunOutcome::Cancelled;
    }
    LOGF_INFO(logger_, logging::LogCategory::Pipeline, "Backtest %s completed: %zu orders",
              util::format_date(date).c_str(),
              pipeline.stream_state().orders.size() + pipeline.stream_state().closed_orders.size());
    return RunOutcome::Completed;
}

} // namespace core
} // namespace zonetrader
