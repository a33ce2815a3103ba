#pragma once

/**
 * Technical indicators over a candle window
 *
 * Every function is pure and deterministic. Windows shorter than the
 * indicator's period return a neutral default instead of failing, so the
 * stream keeps moving during warm-up:
 *   RSI 50, ADX 25, DI 50/50, Stochastics 50/50, Williams %R -50, CCI 0,
 *   relative volume 1.0
 *
 * Wilder smoothing (ATR, ADX, RSI): seed with the mean of the first
 * `period` values, then s' = (s * (period - 1) + v) / period.
 */

#include "../market/candle.hpp"
#include "analysis_types.hpp"

#include <span>

namespace zonetrader {
namespace analysis {

using CandleSpan = std::span<const market::Candle>;

/**
 * Indicator periods. Defaults are the classic literature values.
 */
struct AnalysisConfig {
    // Trend
    int trend_period = 14;
    int short_ma_period = 9;
    int long_ma_period = 21;

    // Momentum (Wilder 1978, Lane, Williams, Lambert)
    int rsi_period = 14;
    int stochastics_k_period = 14;
    int stochastics_d_period = 3;
    int williams_r_period = 14;
    int cci_period = 20;

    // Volatility
    int atr_period = 14;
    int keltner_period = 20;
    double keltner_multiplier = 1.5;
    int bollinger_period = 20;
    double bollinger_multiplier = 2.0;
    int std_dev_period = 20;

    // Volume
    int profile_levels = 30;
    int relative_volume_lookback = 20;
    int volume_trend_periods = 5;
    int obv_window = 200;

    // Most recent candles fed to the indicators per step
    int lookback_candles = 120;
};

// ============================================================================
// Shared math
// ============================================================================

double wilders_smoothing(std::span<const double> values, int period);
double true_range(const market::Candle& current, const market::Candle& previous);

// ============================================================================
// Trend
// ============================================================================

double simple_moving_average(CandleSpan candles, int depth);
double exponential_moving_average(CandleSpan candles, int depth);
double triangular_moving_average(CandleSpan candles, int depth);
DMIResult calculate_dmi(CandleSpan candles, int period = 14);
double calculate_adx(CandleSpan candles, int period = 14);
TrendAnalysis analyze_trend(CandleSpan candles, const AnalysisConfig& config = AnalysisConfig());

// ============================================================================
// Momentum
// ============================================================================

double calculate_rsi(CandleSpan candles, int period = 14);
Stochastics calculate_stochastics(CandleSpan candles, int k_period = 14, int d_period = 3);
double calculate_williams_r(CandleSpan candles, int period = 14);
double calculate_cci(CandleSpan candles, int period = 20);
MomentumAnalysis analyze_momentum(CandleSpan candles, const AnalysisConfig& config = AnalysisConfig());

// ============================================================================
// Volatility
// ============================================================================

TrueRangeAnalysis calculate_true_range_analysis(CandleSpan candles, int period = 14);
KeltnerChannels calculate_keltner_channels(CandleSpan candles, int period = 20, double atr_multiplier = 1.5);
BollingerBands calculate_bollinger_bands(CandleSpan candles, int period = 20, double std_dev_multiplier = 2.0);
StdDevBands calculate_std_dev_bands(CandleSpan candles, int period = 20);
VolatilityAnalysis analyze_volatility(CandleSpan candles, const AnalysisConfig& config = AnalysisConfig());

// ============================================================================
// Volume
// ============================================================================

VolumeProfile build_volume_profile(CandleSpan candles, int price_levels = 30);
VwapAnalysis calculate_vwap(CandleSpan candles);
double calculate_obv(CandleSpan candles);
double calculate_vpt(CandleSpan candles);
double calculate_relative_volume(CandleSpan candles, int lookback = 20);
TrendChange calculate_volume_trend(CandleSpan candles, int periods = 5);
VolumeAnalysis analyze_volume(CandleSpan candles, const AnalysisConfig& config = AnalysisConfig());

} // namespace analysis
} // namespace zonetrader
