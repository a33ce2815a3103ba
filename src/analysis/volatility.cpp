#include "../../include/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace zonetrader {
namespace analysis {

namespace {

VolatilityLevel level_from_ratio(double ratio) {
    if (ratio > 2.0)
        return VolatilityLevel::Extreme;
    if (ratio > 1.5)
        return VolatilityLevel::High;
    if (ratio < 0.5)
        return VolatilityLevel::Low;
    return VolatilityLevel::Normal;
}

BandPosition position_of(double price, double upper, double lower) {
    if (price > upper)
        return BandPosition::Above;
    if (price < lower)
        return BandPosition::Below;
    return BandPosition::Inside;
}

double mean_close(CandleSpan candles) {
    double sum = 0;
    for (const auto& c : candles) {
        sum += c.close;
    }
    return sum / static_cast<double>(candles.size());
}

// Population standard deviation of closes around `mean`
double close_std_dev(CandleSpan candles, double mean) {
    double variance = 0;
    for (const auto& c : candles) {
        variance += (c.close - mean) * (c.close - mean);
    }
    return std::sqrt(variance / static_cast<double>(candles.size()));
}

} // namespace

TrueRangeAnalysis calculate_true_range_analysis(CandleSpan candles, int period) {
    TrueRangeAnalysis result;
    if (candles.empty())
        return result;

    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 1) {
        const auto& current = candles.back();
        const auto& previous = candles.size() >= 2 ? candles[candles.size() - 2] : current;
        double tr = true_range(current, previous);
        result.current_tr = tr;
        result.atr = tr;
        return result;
    }

    std::vector<double> true_ranges;
    true_ranges.reserve(candles.size() - 1);
    for (size_t i = 1; i < candles.size(); ++i) {
        true_ranges.push_back(true_range(candles[i], candles[i - 1]));
    }

    result.atr = wilders_smoothing(true_ranges, period);
    result.current_tr = true_ranges.back();

    // Compare the latest period's ATR with one shifted half a period back
    size_t p = static_cast<size_t>(period);
    if (true_ranges.size() >= p * 2) {
        std::span<const double> all(true_ranges);
        double recent_atr = wilders_smoothing(all.last(p), period);
        double older_atr = wilders_smoothing(all.first(all.size() - p / 2).last(p), period);
        if (recent_atr > older_atr * 1.1)
            result.atr_trend = TrendChange::Increasing;
        else if (recent_atr < older_atr * 0.9)
            result.atr_trend = TrendChange::Decreasing;
    }

    if (result.atr > 0)
        result.level = level_from_ratio(result.current_tr / result.atr);
    return result;
}

KeltnerChannels calculate_keltner_channels(CandleSpan candles, int period, double atr_multiplier) {
    KeltnerChannels result;
    if (candles.empty())
        return result;

    double price = candles.back().close;
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        result.upper = price * 1.02;
        result.center = price;
        result.lower = price * 0.98;
        result.width = 0.04;
        return result;
    }

    result.center = mean_close(candles.last(static_cast<size_t>(period)));
    double atr = calculate_true_range_analysis(candles, std::min(14, period)).atr;
    result.upper = result.center + atr * atr_multiplier;
    result.lower = result.center - atr * atr_multiplier;
    result.width = result.center != 0 ? (result.upper - result.lower) / result.center : 0.0;
    result.position = position_of(price, result.upper, result.lower);
    return result;
}

BollingerBands calculate_bollinger_bands(CandleSpan candles, int period, double std_dev_multiplier) {
    BollingerBands result;
    if (candles.empty())
        return result;

    double price = candles.back().close;
    if (period <= 0 || candles.size() < static_cast<size_t>(period)) {
        result.upper = price * 1.02;
        result.center = price;
        result.lower = price * 0.98;
        result.bandwidth = 0.04;
        result.percent_b = 0.5;
        return result;
    }

    auto recent = candles.last(static_cast<size_t>(period));
    double sma = mean_close(recent);
    double std_dev = close_std_dev(recent, sma);

    result.center = sma;
    result.upper = sma + std_dev * std_dev_multiplier;
    result.lower = sma - std_dev * std_dev_multiplier;
    result.bandwidth = sma != 0 ? (result.upper - result.lower) / sma : 0.0;
    result.percent_b =
        result.upper != result.lower ? (price - result.lower) / (result.upper - result.lower) : 0.5;
    result.position = position_of(price, result.upper, result.lower);
    return result;
}

StdDevBands calculate_std_dev_bands(CandleSpan candles, int period) {
    StdDevBands result;
    if (candles.empty())
        return result;

    auto recent = candles.last(std::min(static_cast<size_t>(std::max(period, 1)), candles.size()));
    result.mean = mean_close(recent);
    result.std_dev = close_std_dev(recent, result.mean);
    result.one_upper = result.mean + result.std_dev;
    result.one_lower = result.mean - result.std_dev;
    result.two_upper = result.mean + 2 * result.std_dev;
    result.two_lower = result.mean - 2 * result.std_dev;

    double price = candles.back().close;
    if (price >= result.two_upper || price <= result.two_lower)
        result.level = 2;
    else if (price >= result.one_upper || price <= result.one_lower)
        result.level = 1;
    return result;
}

VolatilityAnalysis analyze_volatility(CandleSpan candles, const AnalysisConfig& config) {
    VolatilityAnalysis result;
    if (candles.empty())
        return result;

    result.true_range = calculate_true_range_analysis(candles, config.atr_period);
    result.keltner = calculate_keltner_channels(candles, config.keltner_period, config.keltner_multiplier);
    result.bollinger = calculate_bollinger_bands(candles, config.bollinger_period, config.bollinger_multiplier);
    result.std_dev = calculate_std_dev_bands(candles, config.std_dev_period);
    return result;
}

} // namespace analysis
} // namespace zonetrader
