#include "../../include/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace zonetrader {
namespace analysis {

double calculate_rsi(CandleSpan candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 1)
        return 50.0;

    std::vector<double> gains;
    std::vector<double> losses;
    gains.reserve(candles.size() - 1);
    losses.reserve(candles.size() - 1);
    for (size_t i = 1; i < candles.size(); ++i) {
        double change = candles[i].close - candles[i - 1].close;
        gains.push_back(change > 0 ? change : 0.0);
        losses.push_back(change < 0 ? -change : 0.0);
    }

    double avg_gain = wilders_smoothing(gains, period);
    double avg_loss = wilders_smoothing(losses, period);

    if (avg_loss == 0.0)
        return 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

Stochastics calculate_stochastics(CandleSpan candles, int k_period, int d_period) {
    if (k_period <= 0 || d_period <= 0 || candles.size() < static_cast<size_t>(k_period))
        return Stochastics{};

    size_t k = static_cast<size_t>(k_period);
    std::vector<double> k_values;
    k_values.reserve(candles.size() - k + 1);
    for (size_t end = k; end <= candles.size(); ++end) {
        auto window = candles.subspan(end - k, k);
        double highest = window.front().high;
        double lowest = window.front().low;
        for (const auto& c : window) {
            highest = std::max(highest, c.high);
            lowest = std::min(lowest, c.low);
        }
        double close = window.back().close;
        k_values.push_back(highest == lowest ? 50.0 : (close - lowest) / (highest - lowest) * 100.0);
    }

    Stochastics result;
    result.k = k_values.back();

    // %D is the SMA of the most recent %K values
    size_t d = std::min(static_cast<size_t>(d_period), k_values.size());
    double sum = 0;
    for (size_t i = k_values.size() - d; i < k_values.size(); ++i) {
        sum += k_values[i];
    }
    result.d = sum / static_cast<double>(d);
    return result;
}

double calculate_williams_r(CandleSpan candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period))
        return -50.0;

    auto recent = candles.last(static_cast<size_t>(period));
    double highest = recent.front().high;
    double lowest = recent.front().low;
    for (const auto& c : recent) {
        highest = std::max(highest, c.high);
        lowest = std::min(lowest, c.low);
    }

    if (highest == lowest)
        return -50.0;
    return (highest - candles.back().close) / (highest - lowest) * -100.0;
}

double calculate_cci(CandleSpan candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period))
        return 0.0;

    auto recent = candles.last(static_cast<size_t>(period));
    std::vector<double> typical;
    typical.reserve(recent.size());
    double sum = 0;
    for (const auto& c : recent) {
        typical.push_back(c.typical_price());
        sum += typical.back();
    }
    double sma = sum / static_cast<double>(typical.size());

    double deviation = 0;
    for (double tp : typical) {
        deviation += std::abs(tp - sma);
    }
    double mean_deviation = deviation / static_cast<double>(typical.size());

    if (mean_deviation == 0.0)
        return 0.0;
    return (typical.back() - sma) / (0.015 * mean_deviation);
}

MomentumAnalysis analyze_momentum(CandleSpan candles, const AnalysisConfig& config) {
    MomentumAnalysis result;
    if (candles.empty())
        return result;

    result.rsi = calculate_rsi(candles, config.rsi_period);
    result.stochastics = calculate_stochastics(candles, config.stochastics_k_period, config.stochastics_d_period);
    result.williams_r = calculate_williams_r(candles, config.williams_r_period);
    result.cci = calculate_cci(candles, config.cci_period);
    return result;
}

} // namespace analysis
} // namespace zonetrader
