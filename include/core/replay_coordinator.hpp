#pragma once

#include "../logging/async_logger.hpp"
#include "../market/candle_source.hpp"
#include "event_pipeline.hpp"

#include <memory>

namespace zonetrader {
namespace core {

struct ReplayConfig {
    int default_plan_days = 2;
    Timestamp trade_warmup_ms = MS_PER_HOUR;   // before the earliest open zone
    Timestamp trade_candle_ms = 5 * MS_PER_MINUTE;
};

/**
 * ReplayCoordinator - bounded historical replays on demand
 *
 * PLAN rebuilds the planning state for a date from the `days` trading days
 * before it up to that date's 09:30 open, with the session windows pinned
 * to the planned date. Each replay writes into its own pipeline and never
 * touches the live StreamState.
 *
 * TRADE hands a late client the context a connected client would have:
 * the open zones and extremes from a snapshot, plus 5-minute candles from
 * an hour before the earliest of them up to the open. Each zone is
 * emitted once, when the candle stream reaches its start.
 */
class ReplayCoordinator {
public:
    ReplayCoordinator(market::ICandleSource& minute_source, market::ICandleSource& five_minute_source,
                      const PipelineConfig& pipeline_config, const ReplayConfig& config = ReplayConfig{},
                      logging::AsyncLogger* logger = nullptr)
        : minute_source_(minute_source), five_minute_source_(five_minute_source),
          pipeline_config_(pipeline_config), config_(config), logger_(logger) {}

    /**
     * Replay the planning window for `date`. days <= 0 uses the default.
     * final_snapshot, when given, receives the replay's last snapshot.
     */
    RunOutcome plan(const util::Date& date, int days, const EventSink& sink, CancelFlag cancel = nullptr,
                    std::shared_ptr<const StreamSnapshot>* final_snapshot = nullptr);

    RunOutcome trade(const StreamSnapshot& snapshot, const util::Date& date, const EventSink& sink,
                     CancelFlag cancel = nullptr);

    /**
     * Trade `date` against a broker. The planning window warms the pipeline
     * up silently; from the open the broker is attached and events flow to
     * the sink until the close.
     */
    RunOutcome backtest(const util::Date& date, int days, broker::IBrokerGateway& gateway, const EventSink& sink,
                        CancelFlag cancel = nullptr);

    // 09:00 of the first planning day through the planned date's 09:30 open
    std::pair<Timestamp, Timestamp> plan_range(const util::Date& date, int days) const;

    const ReplayConfig& config() const { return config_; }

private:
    market::ICandleSource& minute_source_;
    market::ICandleSource& five_minute_source_;
    PipelineConfig pipeline_config_;
    ReplayConfig config_;
    logging::AsyncLogger* logger_;
};

} // namespace core
} // namespace zonetrader
