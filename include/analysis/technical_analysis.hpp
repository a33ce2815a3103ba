#pragma once

#include "indicators.hpp"

#include <algorithm>

namespace zonetrader {
namespace analysis {

/**
 * TechnicalAnalysisEngine - one snapshot of every indicator per candle
 *
 * Feeds the most recent `lookback_candles` of the window to the indicator
 * functions. Stateless apart from its configuration, so two engines with the
 * same config produce bit-identical output for the same window.
 */
class TechnicalAnalysisEngine {
public:
    explicit TechnicalAnalysisEngine(const AnalysisConfig& config = AnalysisConfig()) : config_(config) {}

    TechnicalAnalysis analyze(CandleSpan window) const {
        TechnicalAnalysis result;
        if (window.empty())
            return result;

        size_t lookback = static_cast<size_t>(std::max(config_.lookback_candles, 1));
        auto recent = window.last(std::min(lookback, window.size()));

        result.timestamp = recent.back().timestamp;
        result.trend = analyze_trend(recent, config_);
        result.momentum = analyze_momentum(recent, config_);
        result.volatility = analyze_volatility(recent, config_);
        result.volume = analyze_volume(recent, config_);
        return result;
    }

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
};

} // namespace analysis
} // namespace zonetrader
