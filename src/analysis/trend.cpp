#include "../../include/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace zonetrader {
namespace analysis {

double simple_moving_average(CandleSpan candles, int depth) {
    if (candles.empty() || depth <= 0)
        return 0.0;
    size_t actual = std::min(static_cast<size_t>(depth), candles.size());
    double sum = 0;
    for (const auto& c : candles.last(actual)) {
        sum += c.close;
    }
    return sum / static_cast<double>(actual);
}

// A slice of 2x the depth (at least 10) converges to the full-history EMA
double exponential_moving_average(CandleSpan candles, int depth) {
    if (candles.empty() || depth <= 0)
        return 0.0;

    double multiplier = 2.0 / (depth + 1);
    size_t required = std::min(candles.size(), static_cast<size_t>(std::max(depth * 2, 10)));
    auto recent = candles.last(required);

    if (recent.size() == 1)
        return recent.front().close;

    // Seed with the mean of the first few closes
    size_t init_length = std::min<size_t>(3, recent.size() - 1);
    double ema = 0;
    for (size_t i = 0; i < init_length; ++i) {
        ema += recent[i].close;
    }
    ema /= static_cast<double>(init_length);

    for (size_t i = init_length; i < recent.size(); ++i) {
        ema = recent[i].close * multiplier + ema * (1 - multiplier);
    }
    return ema;
}

double triangular_moving_average(CandleSpan candles, int depth) {
    if (candles.empty() || depth <= 0)
        return 0.0;

    size_t period1, period2;
    if (depth % 2 == 1) {
        period1 = period2 = static_cast<size_t>((depth + 1) / 2);
    } else {
        period1 = static_cast<size_t>(depth / 2);
        period2 = static_cast<size_t>(depth / 2 + 1);
    }

    size_t required = period1 + period2 - 1;
    if (candles.size() < required)
        return simple_moving_average(candles, std::min(depth, static_cast<int>(candles.size())));

    auto recent = candles.last(required);

    // First layer: SMA(period1) ending at each index; second layer averages the last period2 of them
    std::vector<double> first_layer;
    first_layer.reserve(required);
    for (size_t i = period1 - 1; i < recent.size(); ++i) {
        double sum = 0;
        for (size_t j = i + 1 - period1; j <= i; ++j) {
            sum += recent[j].close;
        }
        first_layer.push_back(sum / static_cast<double>(period1));
    }

    size_t take = std::min(period2, first_layer.size());
    double sum = 0;
    for (size_t i = first_layer.size() - take; i < first_layer.size(); ++i) {
        sum += first_layer[i];
    }
    return sum / static_cast<double>(period2);
}

namespace {

struct DirectionalMovement {
    double plus_dm;
    double minus_dm;
};

DirectionalMovement directional_movement(const market::Candle& current, const market::Candle& previous) {
    double up_move = current.high - previous.high;
    double down_move = previous.low - current.low;
    return {(up_move > down_move && up_move > 0) ? up_move : 0.0,
            (down_move > up_move && down_move > 0) ? down_move : 0.0};
}

double directional_index(double plus_di, double minus_di) {
    double sum = plus_di + minus_di;
    return sum != 0 ? std::abs(plus_di - minus_di) / sum * 100.0 : 0.0;
}

} // namespace

DMIResult calculate_dmi(CandleSpan candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period) + 1)
        return DMIResult{};

    std::vector<double> true_ranges;
    std::vector<double> plus_dms;
    std::vector<double> minus_dms;
    true_ranges.reserve(candles.size());
    plus_dms.reserve(candles.size());
    minus_dms.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        true_ranges.push_back(true_range(candles[i], candles[i - 1]));
        auto dm = directional_movement(candles[i], candles[i - 1]);
        plus_dms.push_back(dm.plus_dm);
        minus_dms.push_back(dm.minus_dm);
    }

    double smoothed_tr = wilders_smoothing(true_ranges, period);
    double smoothed_plus = wilders_smoothing(plus_dms, period);
    double smoothed_minus = wilders_smoothing(minus_dms, period);

    DMIResult result;
    result.plus_di = smoothed_tr != 0 ? smoothed_plus / smoothed_tr * 100.0 : 0.0;
    result.minus_di = smoothed_tr != 0 ? smoothed_minus / smoothed_tr * 100.0 : 0.0;
    result.adx = directional_index(result.plus_di, result.minus_di); // single DX, see calculate_adx
    return result;
}

/**
 * ADX: Wilder-smoothed DX, one DX per rolling (period + 2)-candle window.
 */
double calculate_adx(CandleSpan candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period) * 2)
        return 25.0;

    size_t window_size = static_cast<size_t>(period) + 1;
    std::vector<double> dx_values;
    dx_values.reserve(candles.size());
    for (size_t i = window_size; i < candles.size(); ++i) {
        auto dmi = calculate_dmi(candles.subspan(i - window_size, window_size + 1), period);
        dx_values.push_back(directional_index(dmi.plus_di, dmi.minus_di));
    }

    return dx_values.empty() ? 25.0 : wilders_smoothing(dx_values, period);
}

TrendAnalysis analyze_trend(CandleSpan candles, const AnalysisConfig& config) {
    TrendAnalysis result;
    if (candles.empty())
        return result;

    result.sma = simple_moving_average(candles, config.trend_period);
    result.ema = exponential_moving_average(candles, config.trend_period);
    result.tma = triangular_moving_average(candles, config.trend_period);
    result.short_term_ma = exponential_moving_average(candles, config.short_ma_period);
    result.long_term_ma = exponential_moving_average(candles, config.long_ma_period);

    auto dmi = calculate_dmi(candles, config.trend_period);
    result.plus_di = dmi.plus_di;
    result.minus_di = dmi.minus_di;
    result.adx = calculate_adx(candles, config.trend_period);
    return result;
}

} // namespace analysis
} // namespace zonetrader
