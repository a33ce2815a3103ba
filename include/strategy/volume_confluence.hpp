#pragma once

#include "../analysis/analysis_types.hpp"
#include "../market/candle.hpp"

#include <algorithm>
#include <span>

namespace zonetrader {
namespace strategy {

enum class DivergenceType : uint8_t { None = 0, Bullish = 1, Bearish = 2 };

inline const char* divergence_type_to_string(DivergenceType type) {
    switch (type) {
    case DivergenceType::None:
        return "None";
    case DivergenceType::Bullish:
        return "Bullish";
    case DivergenceType::Bearish:
        return "Bearish";
    default:
        return "Unknown";
    }
}

struct VolumeConfluenceSignal {
    bool has_volume_spike = false;   // relative volume > 1.5
    bool has_massive_spike = false;  // relative volume > 2.0
    DivergenceType divergence = DivergenceType::None;
    bool is_accumulation = false;
    bool is_distribution = false;
    double volume_confirmation = 0.5; // 0-1
    Timestamp timestamp = 0;

    bool has_divergence() const { return divergence != DivergenceType::None; }
};

/**
 * VolumeConfluence - volume evidence for or against a move
 *
 * Rows and candles are aligned and oldest first. Fewer than five of either
 * gives the neutral signal (no spike, confirmation 0.5).
 */
class VolumeConfluence {
public:
    VolumeConfluenceSignal analyze(std::span<const analysis::TechnicalAnalysis> rows,
                                   std::span<const market::Candle> candles) const {
        VolumeConfluenceSignal signal;
        if (!candles.empty())
            signal.timestamp = candles.back().timestamp;
        if (rows.size() < 5 || candles.size() < 5)
            return signal;

        const auto& current = rows.back().volume;
        signal.has_volume_spike = current.relative_volume > 1.5;
        signal.has_massive_spike = current.relative_volume > 2.0;
        signal.divergence = detect_divergence(rows, candles);
        detect_accumulation(rows, candles, signal.is_accumulation, signal.is_distribution);
        signal.volume_confirmation = confirmation(current, signal);
        return signal;
    }

    // Price and volume moving against each other over the last 5 vs previous 5
    static DivergenceType detect_divergence(std::span<const analysis::TechnicalAnalysis> rows,
                                            std::span<const market::Candle> candles) {
        if (rows.size() < 10 || candles.size() < 10)
            return DivergenceType::None;

        double last_avg = 0;
        double prev_avg = 0;
        for (size_t i = 0; i < 5; ++i) {
            last_avg += rows[rows.size() - 5 + i].volume.relative_volume;
            prev_avg += rows[rows.size() - 10 + i].volume.relative_volume;
        }
        last_avg /= 5.0;
        prev_avg /= 5.0;

        double price_change = candles.back().close - candles[candles.size() - 5].close;
        bool volume_up = last_avg > prev_avg * 1.1;
        bool volume_down = last_avg < prev_avg * 0.9;

        if (price_change < 0 && volume_up)
            return DivergenceType::Bullish;
        if (price_change > 0 && volume_down)
            return DivergenceType::Bearish;
        return DivergenceType::None;
    }

    static void detect_accumulation(std::span<const analysis::TechnicalAnalysis> rows,
                                    std::span<const market::Candle> candles, bool& accumulation,
                                    bool& distribution) {
        accumulation = false;
        distribution = false;
        if (rows.size() < 10 || candles.size() < 10)
            return;

        auto last_rows = rows.last(10);
        auto last_candles = candles.last(10);
        double low = last_candles.front().low;
        double high = last_candles.front().high;
        for (const auto& c : last_candles) {
            low = std::min(low, c.low);
            high = std::max(high, c.high);
        }
        double range = high - low;
        double position = range > 0 ? (last_candles.back().close - low) / range : 0.5;

        bool obv_rising = last_rows.back().volume.on_balance_volume > last_rows.front().volume.on_balance_volume;
        bool volume_rising = last_rows.back().volume.is_volume_increasing();

        accumulation = position < 0.4 && volume_rising && obv_rising;
        distribution = position > 0.6 && volume_rising && !obv_rising;
    }

    static double confirmation(const analysis::VolumeAnalysis& current, const VolumeConfluenceSignal& signal) {
        double score = 0.5;
        if (current.relative_volume > 1.5)
            score += 0.2;
        else if (current.relative_volume > 1.2)
            score += 0.1;
        else if (current.relative_volume < 0.8)
            score -= 0.15;

        if (current.is_volume_increasing())
            score += 0.15;

        switch (current.quality()) {
        case analysis::VolumeQuality::Excellent:
            score += 0.15;
            break;
        case analysis::VolumeQuality::Good:
            score += 0.10;
            break;
        case analysis::VolumeQuality::Poor:
            score -= 0.15;
            break;
        default:
            break;
        }

        if (signal.has_divergence())
            score -= 0.1;
        if (signal.is_accumulation)
            score += 0.1;
        if (signal.is_distribution)
            score -= 0.1;
        return std::clamp(score, 0.0, 1.0);
    }

    // Rising relative volume behind a 3-candle move in the trade's direction
    static bool confirms_direction(std::span<const analysis::TechnicalAnalysis> rows,
                                   std::span<const market::Candle> candles, bool is_long) {
        if (rows.size() < 3 || candles.size() < 3)
            return false;
        auto last_rows = rows.last(3);
        auto last_candles = candles.last(3);
        bool volume_rising = last_rows.back().volume.relative_volume > last_rows.front().volume.relative_volume;
        double move = last_candles.back().close - last_candles.front().close;
        bool price_confirms = is_long ? move > 0 : move < 0;
        return volume_rising && price_confirms && last_rows.back().volume.relative_volume > 1.1;
    }
};

} // namespace strategy
} // namespace zonetrader
