#pragma once

#include "../types.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <vector>

namespace zonetrader {
namespace analysis {

// ============================================================================
// Shared enums
// ============================================================================

// Direction of change of a rolling quantity (ATR, volume)
enum class TrendChange : uint8_t { Stable = 0, Increasing = 1, Decreasing = 2 };

enum class VolatilityLevel : uint8_t { Low = 0, Normal = 1, High = 2, Extreme = 3 };

// Close relative to a band pair
enum class BandPosition : uint8_t { Inside = 0, Above = 1, Below = 2 };

enum class VwapPosition : uint8_t { At = 0, Above = 1, Below = 2 };

enum class MomentumState : uint8_t { Neutral = 0, Oversold = 1, Overbought = 2 };

enum class VolumeQuality : uint8_t { Poor = 0, Fair = 1, Good = 2, Excellent = 3 };

inline const char* trend_change_to_string(TrendChange change) {
    switch (change) {
    case TrendChange::Stable:
        return "Stable";
    case TrendChange::Increasing:
        return "Increasing";
    case TrendChange::Decreasing:
        return "Decreasing";
    default:
        return "Unknown";
    }
}

inline const char* volatility_level_to_string(VolatilityLevel level) {
    switch (level) {
    case VolatilityLevel::Low:
        return "Low";
    case VolatilityLevel::Normal:
        return "Normal";
    case VolatilityLevel::High:
        return "High";
    case VolatilityLevel::Extreme:
        return "Extreme";
    default:
        return "Unknown";
    }
}

inline const char* band_position_to_string(BandPosition position) {
    switch (position) {
    case BandPosition::Inside:
        return "Inside";
    case BandPosition::Above:
        return "Above";
    case BandPosition::Below:
        return "Below";
    default:
        return "Unknown";
    }
}

inline const char* vwap_position_to_string(VwapPosition position) {
    switch (position) {
    case VwapPosition::At:
        return "At";
    case VwapPosition::Above:
        return "Above";
    case VwapPosition::Below:
        return "Below";
    default:
        return "Unknown";
    }
}

inline const char* momentum_state_to_string(MomentumState state) {
    switch (state) {
    case MomentumState::Neutral:
        return "Neutral";
    case MomentumState::Oversold:
        return "Oversold";
    case MomentumState::Overbought:
        return "Overbought";
    default:
        return "Unknown";
    }
}

inline const char* volume_quality_to_string(VolumeQuality quality) {
    switch (quality) {
    case VolumeQuality::Poor:
        return "Poor";
    case VolumeQuality::Fair:
        return "Fair";
    case VolumeQuality::Good:
        return "Good";
    case VolumeQuality::Excellent:
        return "Excellent";
    default:
        return "Unknown";
    }
}

// ============================================================================
// Trend
// ============================================================================

struct DMIResult {
    double plus_di = 50.0;
    double minus_di = 50.0;
    double adx = 25.0;
};

// ADX above this marks a trend strong enough to have a direction
constexpr double STRONG_TREND_ADX = 25.0;

struct TrendAnalysis {
    double sma = 0;
    double ema = 0;
    double tma = 0;
    double short_term_ma = 0; // 9-period EMA
    double long_term_ma = 0;  // 21-period EMA
    double plus_di = 50.0;
    double minus_di = 50.0;
    double adx = 25.0;

    bool is_uptrend() const { return plus_di > minus_di; }
    bool is_downtrend() const { return minus_di > plus_di; }
    bool is_strong_trend() const { return adx > STRONG_TREND_ADX; }

    // Weak trends are Doji regardless of DI dominance
    Direction direction() const {
        if (!is_strong_trend())
            return Direction::Doji;
        return is_uptrend() ? Direction::Up : Direction::Down;
    }

    bool is_golden_cross() const { return short_term_ma > long_term_ma; }
    bool is_death_cross() const { return short_term_ma < long_term_ma; }

    double ma_crossover_strength() const {
        if (long_term_ma == 0)
            return 0;
        return std::abs(short_term_ma - long_term_ma) / long_term_ma;
    }
};

// ============================================================================
// Momentum
// ============================================================================

struct Stochastics {
    double k = 50.0;
    double d = 50.0;

    bool is_overbought() const { return k > 80.0 || d > 80.0; }
    bool is_oversold() const { return k < 20.0 || d < 20.0; }
    bool is_bullish_crossover() const { return k > d; }
};

struct MomentumAnalysis {
    double rsi = 50.0;
    Stochastics stochastics;
    double williams_r = -50.0;
    double cci = 0.0;

    bool rsi_overbought() const { return rsi > 70.0; }
    bool rsi_oversold() const { return rsi < 30.0; }

    // Williams %R runs 0 to -100
    bool williams_r_overbought() const { return williams_r > -20.0; }
    bool williams_r_oversold() const { return williams_r < -80.0; }

    bool cci_overbought() const { return cci > 100.0; }
    bool cci_oversold() const { return cci < -100.0; }

    // Two of four oscillators agreeing decides
    MomentumState overall_momentum() const {
        int oversold = rsi_oversold() + stochastics.is_oversold() + williams_r_oversold() + cci_oversold();
        int overbought = rsi_overbought() + stochastics.is_overbought() + williams_r_overbought() + cci_overbought();
        if (oversold >= 2)
            return MomentumState::Oversold;
        if (overbought >= 2)
            return MomentumState::Overbought;
        return MomentumState::Neutral;
    }
};

// ============================================================================
// Volatility
// ============================================================================

struct TrueRangeAnalysis {
    double current_tr = 0;
    double atr = 0;
    TrendChange atr_trend = TrendChange::Stable;
    VolatilityLevel level = VolatilityLevel::Normal;

    bool is_high_volatility() const { return level == VolatilityLevel::High || level == VolatilityLevel::Extreme; }
    bool is_low_volatility() const { return level == VolatilityLevel::Low; }
    bool is_volatility_increasing() const { return atr_trend == TrendChange::Increasing; }
};

struct KeltnerChannels {
    double upper = 0;
    double center = 0;
    double lower = 0;
    double width = 0; // (upper - lower) / center
    BandPosition position = BandPosition::Inside;
};

struct BollingerBands {
    double upper = 0;
    double center = 0; // SMA
    double lower = 0;
    double bandwidth = 0; // (upper - lower) / SMA
    double percent_b = 0.5;
    BandPosition position = BandPosition::Inside;

    bool is_overbought() const { return percent_b > 0.8; }
    bool is_oversold() const { return percent_b < 0.2; }
    bool is_squeezing() const { return bandwidth < 0.1; }
    bool is_expanding() const { return bandwidth > 0.2; }
};

struct StdDevBands {
    double mean = 0;
    double std_dev = 0;
    double one_upper = 0;
    double one_lower = 0;
    double two_upper = 0;
    double two_lower = 0;
    int level = 0; // 0 inside 1 sigma, 1 beyond 1 sigma, 2 beyond 2 sigma
};

struct VolatilityAnalysis {
    TrueRangeAnalysis true_range;
    KeltnerChannels keltner;
    BollingerBands bollinger;
    StdDevBands std_dev;

    // Majority vote of the true-range level, Keltner width and Bollinger bandwidth
    VolatilityLevel overall_volatility() const {
        int high = 0;
        int low = 0;
        if (true_range.level == VolatilityLevel::High)
            ++high;
        else if (true_range.level == VolatilityLevel::Low)
            ++low;
        if (keltner.width > 0.02)
            ++high;
        if (bollinger.bandwidth > 0.2)
            ++high;
        else if (bollinger.bandwidth < 0.1)
            ++low;
        if (high >= 2)
            return VolatilityLevel::High;
        if (low >= 2)
            return VolatilityLevel::Low;
        return VolatilityLevel::Normal;
    }
};

// ============================================================================
// Volume
// ============================================================================

struct VolumeProfileLevel {
    double price = 0;
    Volume volume = 0;
    double percent_of_total = 0;
};

struct VolumeProfile {
    std::vector<VolumeProfileLevel> levels; // ascending price
    double poc_price = 0;
    Volume poc_volume = 0;
    double value_area_high = 0;
    double value_area_low = 0;
    Volume total_volume = 0;

    bool is_in_value_area(double price) const { return price >= value_area_low && price <= value_area_high; }
};

struct VwapAnalysis {
    double vwap = 0;
    std::array<double, 3> bands{0.5, 1.0, 1.5}; // 1, 2 and 3 sigma distances
    VwapPosition position = VwapPosition::At;
    double slope = 0;
    double volume_weighted_price = 0;
};

struct VolumeAnalysis {
    VolumeProfile profile;
    VwapAnalysis vwap;
    double relative_volume = 1.0;
    TrendChange volume_trend = TrendChange::Stable;
    double on_balance_volume = 0;
    double volume_price_trend = 0;

    bool is_high_volume() const { return relative_volume > 1.5; }
    bool is_low_volume() const { return relative_volume < 0.5; }
    bool is_volume_increasing() const { return volume_trend == TrendChange::Increasing; }

    VolumeQuality quality() const {
        if (is_high_volume() && is_volume_increasing())
            return VolumeQuality::Excellent;
        if (is_high_volume() || is_volume_increasing())
            return VolumeQuality::Good;
        if (is_low_volume())
            return VolumeQuality::Poor;
        return VolumeQuality::Fair;
    }
};

/**
 * All analytics computed for one candle.
 */
struct TechnicalAnalysis {
    Timestamp timestamp = 0;
    TrendAnalysis trend;
    MomentumAnalysis momentum;
    VolatilityAnalysis volatility;
    VolumeAnalysis volume;
};

} // namespace analysis
} // namespace zonetrader
