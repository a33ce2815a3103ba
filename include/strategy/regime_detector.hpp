#pragma once

/**
 * RegimeDetector - classifies the market into the regime that picks a strategy
 *
 * Scores trend strength, volatility and volume on 0-100 from the recent
 * analytics rows, then classifies:
 *   Breakout      Bollinger squeeze while ATR is rising
 *   TrendingHigh  trend > 50 and volatility > 60
 *   TrendingLow   trend > 50
 *   RangingWide   volatility > 50
 *   RangingTight  otherwise
 *   Unknown       fewer than 5 rows
 * Unknown and RangingWide are do-not-trade regimes.
 */

#include "../analysis/analysis_types.hpp"
#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <span>

namespace zonetrader {
namespace strategy {

enum class MarketRegime : uint8_t { TrendingHigh, TrendingLow, RangingTight, RangingWide, Breakout, Unknown };

inline const char* regime_to_string(MarketRegime regime) {
    switch (regime) {
    case MarketRegime::TrendingHigh:
        return "TrendingHigh";
    case MarketRegime::TrendingLow:
        return "TrendingLow";
    case MarketRegime::RangingTight:
        return "RangingTight";
    case MarketRegime::RangingWide:
        return "RangingWide";
    case MarketRegime::Breakout:
        return "Breakout";
    default:
        return "Unknown";
    }
}

struct RegimeClassification {
    MarketRegime regime = MarketRegime::Unknown;
    double trend_score = 0;      // 0-100
    double volatility_score = 0; // 0-100
    double volume_score = 0;     // 0-100
    double confidence = 0;       // 0-1
    bool is_transitioning = false;
    Timestamp timestamp = 0;

    bool is_trending() const { return regime == MarketRegime::TrendingHigh || regime == MarketRegime::TrendingLow; }
    bool is_ranging() const { return regime == MarketRegime::RangingTight || regime == MarketRegime::RangingWide; }
    bool is_breakout() const { return regime == MarketRegime::Breakout; }
    bool is_tradeable() const { return regime != MarketRegime::Unknown && regime != MarketRegime::RangingWide; }
    bool is_high_volatility() const { return volatility_score > 60.0; }
    bool is_low_volatility() const { return volatility_score < 40.0; }
};

class RegimeDetector {
public:
    static constexpr size_t MIN_SAMPLES = 5;

    /**
     * Classify from analytics rows, oldest first. Empty or short input
     * yields Unknown with zero scores.
     */
    RegimeClassification detect(std::span<const analysis::TechnicalAnalysis> recent) const {
        RegimeClassification result;
        if (recent.empty())
            return result;
        result.timestamp = recent.back().timestamp;
        if (recent.size() < MIN_SAMPLES)
            return result;

        const auto& current = recent.back();
        result.trend_score = trend_score(current.trend, recent);
        result.volatility_score = volatility_score(current.volatility, recent);
        result.volume_score = volume_score(current.volume, recent);
        result.regime = classify(result.trend_score, result.volatility_score, current.volatility);
        result.confidence =
            confidence(result.trend_score, result.volatility_score, result.volume_score, recent.size());
        result.is_transitioning = detect_transition(recent);
        return result;
    }

    static double trend_score(const analysis::TrendAnalysis& current,
                              std::span<const analysis::TechnicalAnalysis> recent) {
        double score = std::min(current.adx, 100.0) * 0.5;

        double consistency = 0.5;
        if (recent.size() >= 5) {
            int up = 0;
            int down = 0;
            for (const auto& row : recent.last(5)) {
                if (row.trend.is_uptrend())
                    ++up;
                if (row.trend.is_downtrend())
                    ++down;
            }
            consistency = std::max(up, down) / 5.0;
        }
        score += consistency * 30.0;
        score += current.ma_crossover_strength() * 20.0;
        return std::min(score, 100.0);
    }

    static double volatility_score(const analysis::VolatilityAnalysis& current,
                                   std::span<const analysis::TechnicalAnalysis> recent) {
        double atr = current.true_range.atr;
        double max_atr = atr;
        for (const auto& row : recent)
            max_atr = std::max(max_atr, row.volatility.true_range.atr);

        double normalized = max_atr > 0 ? (atr / max_atr) * 100.0 : 50.0;
        double trend_bonus = 0;
        if (current.true_range.atr_trend == analysis::TrendChange::Increasing)
            trend_bonus = 10.0;
        else if (current.true_range.atr_trend == analysis::TrendChange::Decreasing)
            trend_bonus = -10.0;
        double squeeze = current.bollinger.is_squeezing() ? -20.0 : 0.0;

        return std::clamp(normalized + trend_bonus + squeeze, 0.0, 100.0);
    }

    static double volume_score(const analysis::VolumeAnalysis& current,
                               std::span<const analysis::TechnicalAnalysis> recent) {
        double score = 50.0;
        if (current.relative_volume > 1.5)
            score += 20.0;
        else if (current.relative_volume > 1.2)
            score += 10.0;
        else if (current.relative_volume < 0.7)
            score -= 15.0;

        if (current.is_volume_increasing())
            score += 15.0;

        if (recent.size() >= 2) {
            double prev_obv = recent[recent.size() - 2].volume.on_balance_volume;
            if (current.on_balance_volume > prev_obv)
                score += 15.0;
            else if (current.on_balance_volume < prev_obv)
                score -= 10.0;
        }
        return std::clamp(score, 0.0, 100.0);
    }

    static MarketRegime classify(double trend, double volatility, const analysis::VolatilityAnalysis& current) {
        if (current.bollinger.is_squeezing() && current.true_range.atr_trend == analysis::TrendChange::Increasing)
            return MarketRegime::Breakout;
        if (trend > 50.0)
            return volatility > 60.0 ? MarketRegime::TrendingHigh : MarketRegime::TrendingLow;
        return volatility > 50.0 ? MarketRegime::RangingWide : MarketRegime::RangingTight;
    }

    // Distance of each score from the undecided midpoint, discounted for thin samples
    static double confidence(double trend, double volatility, double volume, size_t samples) {
        double average = (std::abs(trend - 50.0) + std::abs(volatility - 50.0) + std::abs(volume - 50.0)) / 150.0;
        double penalty = samples < 10 ? 0.7 : (samples < 20 ? 0.85 : 1.0);
        return average * penalty;
    }

    static bool detect_transition(std::span<const analysis::TechnicalAnalysis> recent) {
        if (recent.size() < 5)
            return false;
        auto last5 = recent.last(5);
        const auto& first = last5.front();
        const auto& last = last5.back();

        bool adx_changing = std::abs(last.trend.adx - first.trend.adx) > 5.0;
        bool level_changing = first.volatility.true_range.level != last.volatility.true_range.level;
        bool direction_flip = first.trend.is_uptrend() != last.trend.is_uptrend();
        return adx_changing || level_changing || direction_flip;
    }
};

} // namespace strategy
} // namespace zonetrader
