#pragma once

#include "../analysis/technical_analysis.hpp"
#include "../broker/broker_gateway.hpp"
#include "../logging/async_logger.hpp"
#include "../market/candle_source.hpp"
#include "../order/order_lifecycle.hpp"
#include "../strategy/order_decision_engine.hpp"
#include "../zones/liquidity_tracker.hpp"
#include "../zones/plan_zone_tracker.hpp"
#include "../zones/swing_detector.hpp"
#include "event.hpp"
#include "stream_state.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace zonetrader {
namespace core {

using EventSink = std::function<void(const Event&)>;

// Shared with the initiator of a run so it can stop it from another thread
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag make_cancel_flag() { return std::make_shared<std::atomic<bool>>(false); }

enum class PipelineState : uint8_t { Idle = 0, Streaming = 1, Completed = 2, Cancelled = 3 };

inline const char* pipeline_state_to_string(PipelineState state) {
    switch (state) {
    case PipelineState::Idle:
        return "Idle";
    case PipelineState::Streaming:
        return "Streaming";
    case PipelineState::Completed:
        return "Completed";
    case PipelineState::Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}

enum class RunOutcome : uint8_t { Completed = 0, Cancelled = 1 };

inline const char* run_outcome_to_string(RunOutcome outcome) {
    switch (outcome) {
    case RunOutcome::Completed:
        return "Completed";
    case RunOutcome::Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}

struct PipelineConfig {
    StreamConfig stream;
    analysis::AnalysisConfig analysis;
    strategy::DecisionConfig decision;
    order::LifecycleConfig lifecycle;
};

/**
 * EventPipeline - turns one candle stream into events
 *
 * Per candle, on the caller's thread and without interleaving:
 *   1. trading-day rollover
 *   2. liquidity extremes, technical analysis, swing points, plan zones
 *   3. order lifecycle and decision (only with a broker attached)
 *   4. emit Candle, SwingPoint, LiquidityExtreme, PlanZone,
 *      TechnicalAnalysis, then Order events
 *   5. publish a snapshot
 *
 * The pipeline owns its StreamState; other threads read snapshot() only.
 * A pipeline runs once: Idle -> Streaming -> Completed | Cancelled.
 */
class EventPipeline {
public:
    EventPipeline(Phase phase, const PipelineConfig& config, EventSink sink, logging::AsyncLogger* logger = nullptr);

    // Orders are decided and tracked only when a gateway is attached
    void attach_broker(broker::IBrokerGateway* gateway);

    /**
     * Fix the trading day instead of deriving it from candle timestamps.
     * Used by planning replays, whose session windows belong to the day
     * being planned.
     */
    void pin_trading_day(const util::Date& day);

    // Closed orders from earlier runs, oldest first, used for risk sizing
    void seed_closed_orders(std::vector<order::Order> closed);

    /**
     * Stream [start, end] from the source. Returns when the range is
     * exhausted (replay), the source closes (live), or the run is
     * cancelled through cancel() or the given flag.
     */
    RunOutcome run(market::ICandleSource& source, Timestamp start, Timestamp end, CancelFlag cancel = nullptr);

    // Open-ended live run
    RunOutcome run_live(market::ICandleSource& source, Timestamp start, CancelFlag cancel = nullptr);

    /**
     * Process one candle. Candles older than the last processed one are
     * dropped with a warning. Returns the events emitted for it.
     */
    std::vector<Event> process(const market::Candle& candle);

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    PipelineState state() const { return state_.load(std::memory_order_acquire); }
    Phase phase() const { return phase_; }

    std::shared_ptr<const StreamSnapshot> snapshot() const {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return snapshot_;
    }

    // Writer-thread access for tests and the owning task
    const StreamState& stream_state() const { return state_data_; }

    uint64_t events_emitted() const { return events_emitted_.load(std::memory_order_relaxed); }

private:
    Phase phase_;
    PipelineConfig config_;
    EventSink sink_;
    logging::AsyncLogger* logger_;

    analysis::TechnicalAnalysisEngine analysis_engine_;
    zones::SwingPointDetector swing_detector_;
    zones::LiquidityZoneTracker liquidity_tracker_;
    zones::PlanZoneTracker plan_zone_tracker_;
    strategy::OrderDecisionEngine decision_engine_;

    broker::IBrokerGateway* gateway_ = nullptr;
    std::unique_ptr<order::OrderLifecycle> lifecycle_;

    std::optional<util::Date> pinned_day_;
    StreamState state_data_;

    std::atomic<PipelineState> state_{PipelineState::Idle};
    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> events_emitted_{0};

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const StreamSnapshot> snapshot_;

    bool is_cancelled(const CancelFlag& flag) const;
    void roll_over(const market::Candle& candle);
    std::vector<order::Order> trade(const market::Candle& candle);
    void publish_snapshot();
};

} // namespace core
} // namespace zonetrader
