#pragma once

#include "../market/candle.hpp"
#include "zone_types.hpp"

#include <algorithm>
#include <optional>
#include <span>

namespace zonetrader {
namespace zones {

/**
 * SwingPointDetector - strict local pivots over a symmetric window
 *
 * After each appended candle the candle `min_confirmations` positions back
 * has a full window on both sides and is tested exactly once. Past pivots
 * are never revised.
 */
class SwingPointDetector {
public:
    explicit SwingPointDetector(int min_confirmations = 1)
        : min_confirmations_(min_confirmations < 1 ? 1 : min_confirmations) {}

    /**
     * Test the newest confirmable candle of the window.
     */
    std::optional<SwingPoint> detect(std::span<const market::Candle> window) const {
        size_t k = static_cast<size_t>(min_confirmations_);
        if (window.size() < 2 * k + 1)
            return std::nullopt;

        size_t i = window.size() - 1 - k;
        const auto& current = window[i];

        double max_high = 0;
        double min_low = 0;
        bool first = true;
        for (size_t j = i - k; j <= i + k; ++j) {
            if (j == i)
                continue;
            if (first) {
                max_high = window[j].high;
                min_low = window[j].low;
                first = false;
            } else {
                max_high = std::max(max_high, window[j].high);
                min_low = std::min(min_low, window[j].low);
            }
        }

        // A candle that is both an outside high and low counts as a high
        if (current.high > max_high)
            return SwingPoint{current.timestamp, current.high, SwingKind::High, Direction::Down};
        if (current.low < min_low)
            return SwingPoint{current.timestamp, current.low, SwingKind::Low, Direction::Up};
        return std::nullopt;
    }

    int min_confirmations() const { return min_confirmations_; }

private:
    int min_confirmations_;
};

} // namespace zones
} // namespace zonetrader
