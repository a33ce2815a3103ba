#include "../../include/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace zonetrader {
namespace analysis {

double wilders_smoothing(std::span<const double> values, int period) {
    if (values.empty())
        return 0.0;
    size_t p = static_cast<size_t>(std::max(period, 1));
    if (values.size() < p)
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());

    double smoothed = std::accumulate(values.begin(), values.begin() + p, 0.0) / static_cast<double>(p);
    for (size_t i = p; i < values.size(); ++i) {
        smoothed = (smoothed * static_cast<double>(p - 1) + values[i]) / static_cast<double>(p);
    }
    return smoothed;
}

double true_range(const market::Candle& current, const market::Candle& previous) {
    double tr1 = current.high - current.low;
    double tr2 = std::abs(current.high - previous.close);
    double tr3 = std::abs(current.low - previous.close);
    return std::max(tr1, std::max(tr2, tr3));
}

} // namespace analysis
} // namespace zonetrader
