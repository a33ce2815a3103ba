#include "../../include/core/event_pipeline.hpp"

#include <limits>

namespace zonetrader {
namespace core {

EventPipeline::EventPipeline(Phase phase, const PipelineConfig& config, EventSink sink, logging::AsyncLogger* logger)
    : phase_(phase), config_(config), sink_(std::move(sink)), logger_(logger), analysis_engine_(config.analysis),
      swing_detector_(config.stream.swing_confirmations), liquidity_tracker_(config.stream.max_liquidity_history),
      plan_zone_tracker_(config.stream.max_plan_zones), decision_engine_(config.decision),
      snapshot_(std::make_shared<StreamSnapshot>()) {}

void EventPipeline::attach_broker(broker::IBrokerGateway* gateway) {
    gateway_ = gateway;
    if (gateway_)
        lifecycle_ = std::make_unique<order::OrderLifecycle>(*gateway_, config_.lifecycle, logger_);
    else
        lifecycle_.reset();
}

void EventPipeline::pin_trading_day(const util::Date& day) { pinned_day_ = day; }

void EventPipeline::seed_closed_orders(std::vector<order::Order> closed) {
    state_data_.closed_orders = std::move(closed);
    for (const auto& o : state_data_.closed_orders)
        state_data_.next_order_id = std::max(state_data_.next_order_id, o.id + 1);
}

bool EventPipeline::is_cancelled(const CancelFlag& flag) const {
    return cancelled_.load(std::memory_order_acquire) || (flag && flag->load(std::memory_order_acquire));
}

RunOutcome EventPipeline::run(market::ICandleSource& source, Timestamp start, Timestamp end, CancelFlag cancel) {
    PipelineState expected = PipelineState::Idle;
    if (!state_.compare_exchange_strong(expected, PipelineState::Streaming)) {
        LOG_WARN(logger_, logging::LogCategory::Pipeline, "Pipeline already ran; ignoring run request");
        return expected == PipelineState::Cancelled ? RunOutcome::Cancelled : RunOutcome::Completed;
    }

    LOGF_INFO(logger_, logging::LogCategory::Pipeline, "%s stream started", phase_to_string(phase_));

    size_t delivered = source.stream(start, end, [&](const market::Candle& candle) {
        if (is_cancelled(cancel))
            return false;
        process(candle);
        return !is_cancelled(cancel);
    });

    RunOutcome outcome = is_cancelled(cancel) ? RunOutcome::Cancelled : RunOutcome::Completed;
    state_.store(outcome == RunOutcome::Cancelled ? PipelineState::Cancelled : PipelineState::Completed,
                 std::memory_order_release);
    LOGF_INFO(logger_, logging::LogCategory::Pipeline, "%s stream %s after %zu candles, %llu events",
              phase_to_string(phase_), run_outcome_to_string(outcome), delivered,
              static_cast<unsigned long long>(events_emitted()));
    return outcome;
}

RunOutcome EventPipeline::run_live(market::ICandleSource& source, Timestamp start, CancelFlag cancel) {
    return run(source, start, std::numeric_limits<Timestamp>::max(), std::move(cancel));
}

std::vector<Event> EventPipeline::process(const market::Candle& candle) {
    std::vector<Event> events;
    StreamState& s = state_data_;

    if (const market::Candle* last = s.last_candle(); last && candle.timestamp < last->timestamp) {
        LOGF_WARN(logger_, logging::LogCategory::Pipeline, "Dropping out-of-order candle %lld (last %lld)",
                  static_cast<long long>(candle.timestamp), static_cast<long long>(last->timestamp));
        return events;
    }

    roll_over(candle);
    const util::Date day = *s.trading_day;

    s.candles.push_back(candle);

    auto extremes = liquidity_tracker_.update(s.extremes, candle, day, !pinned_day_.has_value());

    s.analytics.push_back(analysis_engine_.analyze(s.candles));
    s.prune_window(config_.stream.max_candles);

    std::vector<zones::SwingPoint> swings;
    if (auto swing = swing_detector_.detect(s.candles)) {
        if (s.swings.empty() || swing->timestamp > s.swings.back().timestamp) {
            s.swings.push_back(*swing);
            swings.push_back(*swing);
        }
    }
    auto plan_zones = plan_zone_tracker_.update(s.plan_zones, s.swings, candle);
    s.prune_swings(config_.stream.max_swings);

    std::vector<order::Order> orders;
    if (lifecycle_)
        orders = trade(candle);

    ++s.processed;

    events.reserve(1 + swings.size() + extremes.size() + plan_zones.size() + 1 + orders.size());
    events.push_back(Event::make(phase_, candle.timestamp, day, candle));
    for (auto& swing : swings)
        events.push_back(Event::make(phase_, candle.timestamp, day, swing));
    for (auto& extreme : extremes)
        events.push_back(Event::make(phase_, candle.timestamp, day, extreme));
    for (auto& zone : plan_zones)
        events.push_back(Event::make(phase_, candle.timestamp, day, zone));
    if (config_.stream.emit_analysis)
        events.push_back(Event::make(phase_, candle.timestamp, day, s.analytics.back()));
    for (auto& o : orders)
        events.push_back(Event::make(phase_, candle.timestamp, day, o));

    if (sink_) {
        for (const auto& event : events)
            sink_(event);
    }
    events_emitted_.fetch_add(events.size(), std::memory_order_relaxed);

    publish_snapshot();
    return events;
}

void EventPipeline::roll_over(const market::Candle& candle) {
    StreamState& s = state_data_;
    util::Date day = pinned_day_ ? *pinned_day_ : util::trading_day_of(candle.timestamp);
    if (s.trading_day && *s.trading_day == day)
        return;

    if (s.trading_day) {
        LOGF_INFO(logger_, logging::LogCategory::Pipeline, "Trading day rollover %s -> %s",
                  util::format_date(*s.trading_day).c_str(), util::format_date(day).c_str());
    }
    s.roll_to(day, config_.stream.max_closed_history);
}

std::vector<order::Order> EventPipeline::trade(const market::Candle& candle) {
    StreamState& s = state_data_;
    std::vector<order::Order> changed = lifecycle_->apply(s.orders, candle);

    strategy::DecisionInput input;
    input.candles = s.candles;
    input.analytics = s.analytics;
    input.orders = s.orders;
    input.closed_history = s.closed_orders;

    strategy::Decision decision = decision_engine_.evaluate(input, s.next_order_id);
    if (decision.order) {
        ++s.next_order_id;
        s.orders.push_back(*decision.order);
        changed.push_back(*decision.order);
        LOGF_INFO(logger_, logging::LogCategory::Decision,
                  "Planned order %llu %s %s entry %.2f stop %.2f target %.2f score %d risk x%.2f",
                  static_cast<unsigned long long>(decision.order->id), order_type_to_string(decision.order->type),
                  decision.order->entry_strategy.c_str(), decision.order->entry_price(),
                  decision.order->stop_loss(), decision.order->take_profit(), decision.score.total(),
                  decision.order->risk_multiplier);
    } else if (decision.outcome == strategy::DecisionOutcome::SetupRejected) {
        LOGF_DEBUG(logger_, logging::LogCategory::Decision, "%s setup rejected: %s",
                   strategy::regime_to_string(decision.regime.regime), decision.detail.c_str());
    }
    return changed;
}

void EventPipeline::publish_snapshot() {
    auto next = std::make_shared<const StreamSnapshot>(StreamSnapshot::of(state_data_));
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(next);
}

} // namespace core
} // namespace zonetrader
