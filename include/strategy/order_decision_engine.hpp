#pragma once

#include "../analysis/analysis_types.hpp"
#include "../market/candle.hpp"
#include "../order/order.hpp"
#include "../util/market_calendar.hpp"
#include "regime_detector.hpp"
#include "risk_sizing.hpp"
#include "signal_scorer.hpp"
#include "volume_confluence.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace zonetrader {
namespace strategy {

struct DecisionConfig {
    int min_signal_score = 75;
    int breakout_min_score = 85;
    double max_daily_r = 6.0; // stop for the day at +6R

    bool blackout_enabled = true;
    int blackout_start_hour = 10; // New York local, [start, end)
    int blackout_end_hour = 12;

    size_t min_candles = 20;
    size_t min_analytics = 10;

    double trending_min_adx = 30.0;
    double ranging_max_adx = 35.0;
    size_t ma_cross_lookback = 10; // candles
    double volume_floor = 0.4;     // minimum volume confirmation for trend entries
    double breakout_relative_volume = 2.0;

    double trend_atr_multiplier = 2.0;
    double breakout_atr_multiplier = 2.5;
    double ranging_atr_multiplier = 1.5;
    double profit_multiplier = 2.5;

    double starting_balance = 50000.0;
};

enum class DecisionOutcome : uint8_t {
    Planned = 0,
    ActiveOrder,
    NearClose,
    Blackout,
    InsufficientData,
    DailyCapReached,
    RegimeNotTradeable,
    SetupRejected,
};

inline const char* decision_outcome_to_string(DecisionOutcome outcome) {
    switch (outcome) {
    case DecisionOutcome::Planned:
        return "Planned";
    case DecisionOutcome::ActiveOrder:
        return "ActiveOrder";
    case DecisionOutcome::NearClose:
        return "NearClose";
    case DecisionOutcome::Blackout:
        return "Blackout";
    case DecisionOutcome::InsufficientData:
        return "InsufficientData";
    case DecisionOutcome::DailyCapReached:
        return "DailyCapReached";
    case DecisionOutcome::RegimeNotTradeable:
        return "RegimeNotTradeable";
    case DecisionOutcome::SetupRejected:
        return "SetupRejected";
    default:
        return "Unknown";
    }
}

/**
 * What the engine sees of one stream at one candle. Candles and analytics
 * are aligned, oldest first. `orders` are the stream's orders for the
 * trading day; `closed_history` adds earlier closed trades for sizing.
 */
struct DecisionInput {
    std::span<const market::Candle> candles;
    std::span<const analysis::TechnicalAnalysis> analytics;
    std::span<const order::Order> orders;
    std::span<const order::Order> closed_history;
};

struct Decision {
    DecisionOutcome outcome = DecisionOutcome::InsufficientData;
    std::optional<order::Order> order;
    RegimeClassification regime;
    SignalScore score;
    std::string detail;
};

/**
 * OrderDecisionEngine - at most one new Planned order per candle
 *
 * Gates, in order: an active order, the last minutes before the close,
 * the blackout window, warm-up data, the daily R cap. Then the regime
 * picks the setup:
 *   Trending      ADX >= 30, MA cross in the last 10 candles, RSI not at an
 *                 extreme, volume confirmation above the floor; stop 2 ATR
 *   Breakout      squeeze on the previous row then relative volume > 2 and
 *                 a stricter score; stop 2.5 ATR
 *   RangingTight  ADX <= 35, price at a Bollinger extreme with RSI,
 *                 Stochastics and Williams %R agreeing; stop 1.5 ATR
 *   RangingWide and Unknown never trade.
 */
class OrderDecisionEngine {
public:
    explicit OrderDecisionEngine(const DecisionConfig& config = DecisionConfig{})
        : config_(config), risk_sizer_() {}

    Decision evaluate(const DecisionInput& in, OrderId next_id) const {
        Decision decision;
        if (in.candles.empty())
            return decision;
        const market::Candle& last = in.candles.back();

        for (const auto& o : in.orders) {
            if (o.is_active()) {
                decision.outcome = DecisionOutcome::ActiveOrder;
                return decision;
            }
        }
        if (util::is_near_trading_close(last.timestamp)) {
            decision.outcome = DecisionOutcome::NearClose;
            return decision;
        }
        if (config_.blackout_enabled &&
            util::is_in_blackout(last.timestamp, config_.blackout_start_hour, config_.blackout_end_hour)) {
            decision.outcome = DecisionOutcome::Blackout;
            return decision;
        }
        if (in.candles.size() < config_.min_candles || in.analytics.size() < config_.min_analytics) {
            decision.outcome = DecisionOutcome::InsufficientData;
            return decision;
        }
        if (daily_r(in.orders) >= config_.max_daily_r) {
            decision.outcome = DecisionOutcome::DailyCapReached;
            return decision;
        }

        decision.regime = regime_detector_.detect(in.analytics);
        VolumeConfluenceSignal volume = volume_confluence_.analyze(in.analytics, in.candles);

        std::optional<Setup> setup;
        switch (decision.regime.regime) {
        case MarketRegime::TrendingHigh:
        case MarketRegime::TrendingLow:
            setup = trending(in, decision, volume);
            break;
        case MarketRegime::Breakout:
            setup = breakout(in, decision, volume);
            break;
        case MarketRegime::RangingTight:
            setup = mean_reversion(in, decision, volume);
            break;
        default:
            decision.outcome = DecisionOutcome::RegimeNotTradeable;
            return decision;
        }
        if (!setup) {
            decision.outcome = DecisionOutcome::SetupRejected;
            return decision;
        }

        decision.order = build_order(in, *setup, decision, next_id);
        decision.outcome = decision.order ? DecisionOutcome::Planned : DecisionOutcome::SetupRejected;
        return decision;
    }

    // +profit_multiplier per winner, -1 per loser
    static double daily_r(std::span<const order::Order> orders) {
        double total = 0;
        for (const auto& o : orders) {
            if (o.status == order::OrderStatus::Profit)
                total += o.profit_multiplier;
            else if (o.status == order::OrderStatus::Loss)
                total -= 1.0;
        }
        return total;
    }

    /**
     * A golden (Long) or death (Short) cross between consecutive rows
     * within the last `lookback` candles.
     */
    static bool recent_ma_cross(std::span<const analysis::TechnicalAnalysis> rows, OrderType type, size_t lookback) {
        if (rows.size() < lookback + 1)
            return false;
        auto window = rows.last(lookback + 1);
        for (size_t i = 1; i < window.size(); ++i) {
            const auto& prev = window[i - 1].trend;
            const auto& curr = window[i].trend;
            if (type == OrderType::Long && !prev.is_golden_cross() && curr.is_golden_cross())
                return true;
            if (type == OrderType::Short && !prev.is_death_cross() && curr.is_death_cross())
                return true;
        }
        return false;
    }

    const DecisionConfig& config() const { return config_; }

private:
    struct Setup {
        OrderType type;
        double atr_multiplier;
        const char* name;
    };

    DecisionConfig config_;
    RegimeDetector regime_detector_;
    VolumeConfluence volume_confluence_;
    SignalScorer scorer_;
    RiskSizer risk_sizer_;

    std::optional<Setup> trending(const DecisionInput& in, Decision& decision,
                                  const VolumeConfluenceSignal& volume) const {
        const auto& current = in.analytics.back();
        OrderType type = current.trend.is_uptrend() ? OrderType::Long : OrderType::Short;

        if (current.trend.adx < config_.trending_min_adx) {
            decision.detail = "adx below trending minimum";
            return std::nullopt;
        }
        if (!recent_ma_cross(in.analytics, type, config_.ma_cross_lookback)) {
            decision.detail = "no recent moving average cross";
            return std::nullopt;
        }
        double rsi = current.momentum.rsi;
        bool momentum_ok = type == OrderType::Long ? (rsi > 25.0 && rsi < 65.0) : (rsi > 35.0 && rsi < 75.0);
        if (!momentum_ok) {
            decision.detail = "momentum at an extreme";
            return std::nullopt;
        }
        if (volume.volume_confirmation < config_.volume_floor) {
            decision.detail = "volume confirmation below floor";
            return std::nullopt;
        }
        decision.score = scorer_.score(type, current, decision.regime, volume);
        if (decision.score.total() < config_.min_signal_score) {
            decision.detail = "score below minimum";
            return std::nullopt;
        }
        return Setup{type, config_.trend_atr_multiplier, "TrendRiding"};
    }

    std::optional<Setup> breakout(const DecisionInput& in, Decision& decision,
                                  const VolumeConfluenceSignal& volume) const {
        const auto& current = in.analytics.back();
        const auto& previous = in.analytics[in.analytics.size() - 2];

        if (!previous.volatility.bollinger.is_squeezing()) {
            decision.detail = "no squeeze before the expansion";
            return std::nullopt;
        }
        if (current.volume.relative_volume <= config_.breakout_relative_volume) {
            decision.detail = "no breakout volume spike";
            return std::nullopt;
        }

        double percent_b = current.volatility.bollinger.percent_b;
        double rsi = current.momentum.rsi;
        OrderType type;
        if (percent_b > 0.5 && rsi > 50.0) {
            type = OrderType::Long;
        } else if (percent_b < 0.5 && rsi < 50.0) {
            type = OrderType::Short;
        } else {
            decision.detail = "breakout direction unclear";
            return std::nullopt;
        }

        decision.score = scorer_.score(type, current, decision.regime, volume);
        if (decision.score.total() < config_.breakout_min_score) {
            decision.detail = "score below breakout minimum";
            return std::nullopt;
        }
        return Setup{type, config_.breakout_atr_multiplier, "Breakout"};
    }

    std::optional<Setup> mean_reversion(const DecisionInput& in, Decision& decision,
                                        const VolumeConfluenceSignal& volume) const {
        const auto& current = in.analytics.back();
        if (current.trend.adx > config_.ranging_max_adx) {
            decision.detail = "adx too high for mean reversion";
            return std::nullopt;
        }

        const auto& bb = current.volatility.bollinger;
        const auto& m = current.momentum;
        OrderType type;
        if (bb.percent_b < 0.3 && m.rsi < 35.0) {
            type = OrderType::Long;
        } else if (bb.percent_b > 0.7 && m.rsi > 65.0) {
            type = OrderType::Short;
        } else {
            decision.detail = "price not at a band extreme";
            return std::nullopt;
        }

        bool convergence = type == OrderType::Long ? (m.stochastics.is_oversold() && m.williams_r_oversold())
                                                   : (m.stochastics.is_overbought() && m.williams_r_overbought());
        if (!convergence) {
            decision.detail = "oscillators do not agree";
            return std::nullopt;
        }

        decision.score = scorer_.score(type, current, decision.regime, volume);
        if (decision.score.total() < config_.min_signal_score) {
            decision.detail = "score below minimum";
            return std::nullopt;
        }
        return Setup{type, config_.ranging_atr_multiplier, "MeanReversion"};
    }

    std::optional<order::Order> build_order(const DecisionInput& in, const Setup& setup, const Decision& decision,
                                            OrderId next_id) const {
        const market::Candle& last = in.candles.back();
        double atr = in.analytics.back().volatility.true_range.atr;
        double entry = last.close;
        double distance = atr * setup.atr_multiplier;

        double low = setup.type == OrderType::Long ? entry - distance : entry;
        double high = setup.type == OrderType::Long ? entry : entry + distance;

        std::vector<order::Order> closed(in.closed_history.begin(), in.closed_history.end());
        for (const auto& o : in.orders) {
            if (o.status == order::OrderStatus::Profit || o.status == order::OrderStatus::Loss)
                closed.push_back(o);
        }
        double risk_multiplier = risk_sizer_.multiplier(closed, config_.starting_balance);

        order::Order o = order::Order::from_band(next_id, last.timestamp, setup.type, low, high,
                                                 config_.profit_multiplier, risk_multiplier);
        o.entry_strategy =
            std::string("Adaptive-") + setup.name + "-" + score_bucket(decision.score.total());
        o.regime = regime_to_string(decision.regime.regime);
        o.score = decision.score.total();

        if (o.at_risk_points() <= 0 || o.take_profit() == o.entry_price())
            return std::nullopt;
        return o;
    }
};

} // namespace strategy
} // namespace zonetrader
