#pragma once

#include "../analysis/analysis_types.hpp"
#include "../types.hpp"
#include "regime_detector.hpp"
#include "volume_confluence.hpp"

#include <algorithm>

namespace zonetrader {
namespace strategy {

/**
 * Setup quality on 0-100 as five components of 0-20 each.
 */
struct SignalScore {
    int trend_alignment = 0;
    int volume_confirmation = 0;
    int momentum_convergence = 0;
    int volatility_context = 0;
    int regime_fit = 0;

    int total() const {
        return trend_alignment + volume_confirmation + momentum_convergence + volatility_context + regime_fit;
    }
    bool is_excellent() const { return total() >= 85; }
    bool is_good() const { return total() >= 75; }
    bool is_marginal() const { return total() >= 65 && total() < 75; }
};

// Entry label bucket for a total score
inline const char* score_bucket(int total) {
    if (total >= 90)
        return "Score90+";
    if (total >= 85)
        return "Score85-89";
    if (total >= 80)
        return "Score80-84";
    if (total >= 75)
        return "Score75-79";
    return "Score<75";
}

class SignalScorer {
public:
    static constexpr int COMPONENT_MAX = 20;

    SignalScore score(OrderType type, const analysis::TechnicalAnalysis& current, const RegimeClassification& regime,
                      const VolumeConfluenceSignal& volume) const {
        SignalScore s;
        s.trend_alignment = trend_alignment(type, current.trend);
        s.volume_confirmation = volume_confirmation(type, volume);
        s.momentum_convergence = momentum_convergence(type, current.momentum);
        s.volatility_context = volatility_context(current.volatility);
        s.regime_fit = regime_fit(type, regime, current.trend);
        return s;
    }

    static int trend_alignment(OrderType type, const analysis::TrendAnalysis& trend) {
        int score = 0;
        if (trend.adx > 40.0)
            score += 10;
        else if (trend.adx > 35.0)
            score += 9;
        else if (trend.adx > 30.0)
            score += 7;
        else if (trend.adx > 25.0)
            score += 5;

        bool is_long = type == OrderType::Long;
        if (is_long ? trend.is_uptrend() : trend.is_downtrend())
            score += 6;
        if (is_long ? trend.is_golden_cross() : trend.is_death_cross())
            score += 4;
        return clamp_component(score);
    }

    static int volume_confirmation(OrderType type, const VolumeConfluenceSignal& volume) {
        int score = 0;
        if (volume.volume_confirmation > 0.8)
            score += 10;
        else if (volume.volume_confirmation > 0.6)
            score += 7;
        else if (volume.volume_confirmation > 0.4)
            score += 4;

        if (volume.has_massive_spike)
            score += 5;
        else if (volume.has_volume_spike)
            score += 3;

        bool is_long = type == OrderType::Long;
        bool pattern_aligns = is_long ? (volume.is_accumulation && !volume.is_distribution)
                                      : (volume.is_distribution && !volume.is_accumulation);
        if (pattern_aligns)
            score += 5;

        DivergenceType against = is_long ? DivergenceType::Bearish : DivergenceType::Bullish;
        if (volume.divergence == against)
            score -= 5;
        return clamp_component(score);
    }

    static int momentum_convergence(OrderType type, const analysis::MomentumAnalysis& m) {
        int score = 0;
        if (type == OrderType::Long) {
            if (m.rsi < 35.0)
                score += 5;
            else if (m.rsi < 45.0)
                score += 4;
            else if (m.rsi < 50.0)
                score += 2;

            if (m.stochastics.is_oversold())
                score += 5;
            else if (m.stochastics.k < 40.0)
                score += 4;
            else if (m.stochastics.k < 50.0)
                score += 2;

            if (m.williams_r_oversold())
                score += 5;
            else if (m.williams_r < -60.0)
                score += 4;
            else if (m.williams_r < -50.0)
                score += 2;

            if (m.cci_oversold())
                score += 5;
            else if (m.cci < 0.0)
                score += 4;
        } else {
            if (m.rsi > 65.0)
                score += 5;
            else if (m.rsi > 55.0)
                score += 4;
            else if (m.rsi > 50.0)
                score += 2;

            if (m.stochastics.is_overbought())
                score += 5;
            else if (m.stochastics.k > 60.0)
                score += 4;
            else if (m.stochastics.k > 50.0)
                score += 2;

            if (m.williams_r_overbought())
                score += 5;
            else if (m.williams_r > -40.0)
                score += 4;
            else if (m.williams_r > -50.0)
                score += 2;

            if (m.cci_overbought())
                score += 5;
            else if (m.cci > 0.0)
                score += 4;
        }
        return clamp_component(score);
    }

    static int volatility_context(const analysis::VolatilityAnalysis& v) {
        int score = 0;
        switch (v.true_range.level) {
        case analysis::VolatilityLevel::Normal:
            score += 10;
            break;
        case analysis::VolatilityLevel::High:
            score += 7;
            break;
        case analysis::VolatilityLevel::Low:
            score += 5;
            break;
        case analysis::VolatilityLevel::Extreme:
            score += 3;
            break;
        default:
            score += 5;
            break;
        }

        const auto& bb = v.bollinger;
        if (bb.is_squeezing())
            score += 3;
        else if (bb.percent_b > 0.2 && bb.percent_b < 0.8)
            score += 5;
        else if (bb.percent_b > 0.1 && bb.percent_b < 0.9)
            score += 3;

        score += v.keltner.position == analysis::BandPosition::Inside ? 5 : 2;
        return clamp_component(score);
    }

    /**
     * Confidence plus how well the side suits the regime. Trending and
     * breakout regimes pay less for a side that fights the directional
     * index; ranging regimes do not care about side.
     */
    static int regime_fit(OrderType type, const RegimeClassification& regime, const analysis::TrendAnalysis& trend) {
        const double lead = type == OrderType::Long ? trend.plus_di - trend.minus_di : trend.minus_di - trend.plus_di;
        int score = 0;
        if (regime.confidence > 0.7)
            score += 10;
        else if (regime.confidence > 0.5)
            score += 7;
        else if (regime.confidence > 0.3)
            score += 4;

        switch (regime.regime) {
        case MarketRegime::TrendingHigh:
        case MarketRegime::TrendingLow:
            score += lead > 0 ? 10 : (lead == 0 ? 5 : -5);
            break;
        case MarketRegime::Breakout:
            score += lead >= 0 ? 8 : 4;
            break;
        case MarketRegime::RangingTight:
            score += 3;
            break;
        case MarketRegime::RangingWide:
            score += 2;
            break;
        default:
            break;
        }

        if (regime.is_transitioning)
            score -= 5;
        return clamp_component(score);
    }

private:
    static int clamp_component(int score) { return std::clamp(score, 0, COMPONENT_MAX); }
};

} // namespace strategy
} // namespace zonetrader
