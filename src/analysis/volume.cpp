#include "../../include/analysis/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <vector>

namespace zonetrader {
namespace analysis {

namespace {

// Weight toward the typical price and (more) toward the close
double volume_weight(double distance_from_typical, double distance_from_close, double candle_range) {
    if (candle_range == 0)
        return 1.0;
    double typical_weight = 1.0 - distance_from_typical / (candle_range + 0.01);
    double close_weight = 1.0 - distance_from_close / (candle_range + 0.01);
    return std::max(typical_weight * 0.3 + close_weight * 0.7, 0.1);
}

double round_to_step(double price, double step) { return std::round(price / step) * step; }

void distribute_candle_volume(const market::Candle& candle, double step, std::map<double, Volume>& profile) {
    double typical = candle.typical_price();
    double range = candle.range();
    int levels_in_candle = std::max(1, static_cast<int>(range / step));

    if (levels_in_candle == 1) {
        profile[round_to_step(typical, step)] += candle.volume;
        return;
    }

    std::map<double, Volume> distribution;
    double level_step = range / levels_in_candle;
    for (int i = 0; i <= levels_in_candle; ++i) {
        double level_price = candle.low + i * level_step;
        double weight = volume_weight(std::abs(level_price - typical), std::abs(level_price - candle.close), range);
        distribution[round_to_step(level_price, step)] +=
            static_cast<Volume>(static_cast<double>(candle.volume) * weight);
    }

    // Weights do not sum to one; the candle's heaviest level absorbs the difference
    Volume distributed = 0;
    auto heaviest = distribution.begin();
    for (auto it = distribution.begin(); it != distribution.end(); ++it) {
        distributed += it->second;
        if (it->second > heaviest->second)
            heaviest = it;
    }
    heaviest->second += candle.volume - distributed;

    for (const auto& [price, volume] : distribution) {
        profile[price] += volume;
    }
}

} // namespace

VolumeProfile build_volume_profile(CandleSpan candles, int price_levels) {
    VolumeProfile profile;
    if (candles.empty())
        return profile;

    if (candles.size() < 2) {
        const auto& c = candles.front();
        double price = c.typical_price();
        profile.levels.push_back({price, c.volume, 100.0});
        profile.poc_price = price;
        profile.poc_volume = c.volume;
        profile.value_area_high = c.high;
        profile.value_area_low = c.low;
        profile.total_volume = c.volume;
        return profile;
    }

    double min_price = candles.front().low;
    double max_price = candles.front().high;
    for (const auto& c : candles) {
        min_price = std::min({min_price, c.low, c.open, c.close, c.high});
        max_price = std::max({max_price, c.low, c.open, c.close, c.high});
    }
    double step = (max_price - min_price) / std::max(price_levels, 1);

    std::map<double, Volume> distribution;
    if (step <= 0) {
        // Flat window: every candle trades at the same price
        Volume total = 0;
        for (const auto& c : candles) {
            total += c.volume;
        }
        distribution[min_price] = total;
    } else {
        for (const auto& c : candles) {
            distribute_candle_volume(c, step, distribution);
        }
    }

    for (const auto& [price, volume] : distribution) {
        profile.total_volume += volume;
    }
    profile.levels.reserve(distribution.size());
    for (const auto& [price, volume] : distribution) {
        double percent = profile.total_volume > 0
                             ? static_cast<double>(volume) / static_cast<double>(profile.total_volume) * 100.0
                             : 0.0;
        profile.levels.push_back({price, volume, percent});
    }

    auto poc = std::max_element(profile.levels.begin(), profile.levels.end(),
                                [](const auto& a, const auto& b) { return a.volume < b.volume; });
    profile.poc_price = poc->price;
    profile.poc_volume = poc->volume;

    // Value area: heaviest levels until 70% of the volume is covered
    std::vector<VolumeProfileLevel> by_volume = profile.levels;
    std::stable_sort(by_volume.begin(), by_volume.end(),
                     [](const auto& a, const auto& b) { return a.volume > b.volume; });
    double target = static_cast<double>(profile.total_volume) * 0.70;
    Volume accumulated = 0;
    bool selected = false;
    double va_high = 0;
    double va_low = 0;
    for (const auto& level : by_volume) {
        if (static_cast<double>(accumulated) >= target)
            break;
        if (!selected) {
            va_high = va_low = level.price;
            selected = true;
        }
        va_high = std::max(va_high, level.price);
        va_low = std::min(va_low, level.price);
        accumulated += level.volume;
    }
    if (!selected) {
        va_high = profile.levels.back().price;
        va_low = profile.levels.front().price;
    }
    profile.value_area_high = va_high;
    profile.value_area_low = va_low;
    return profile;
}

VwapAnalysis calculate_vwap(CandleSpan candles) {
    VwapAnalysis result;
    if (candles.empty())
        return result;

    if (candles.size() == 1) {
        double price = candles.front().typical_price();
        result.vwap = price;
        result.volume_weighted_price = price;
        return result;
    }

    double cumulative_pv = 0;
    double cumulative_pv2 = 0;
    Volume cumulative_volume = 0;
    std::vector<double> progression;
    progression.reserve(candles.size());

    for (const auto& c : candles) {
        double typical = c.typical_price();
        cumulative_pv += typical * static_cast<double>(c.volume);
        cumulative_pv2 += typical * typical * static_cast<double>(c.volume);
        cumulative_volume += c.volume;
        progression.push_back(cumulative_volume > 0 ? cumulative_pv / static_cast<double>(cumulative_volume)
                                                    : typical);
    }

    double vwap = progression.back();
    double variance =
        cumulative_volume > 0 ? cumulative_pv2 / static_cast<double>(cumulative_volume) - vwap * vwap : 0.0;
    double std_dev = std::sqrt(std::max(variance, 0.0));

    result.vwap = vwap;
    result.bands = {std_dev, 2 * std_dev, 3 * std_dev};

    size_t recent = std::min<size_t>(5, progression.size());
    const double first = progression[progression.size() - recent];
    result.slope = (progression.back() - first) / static_cast<double>(recent);

    double price = candles.back().close;
    if (price > vwap + 0.01)
        result.position = VwapPosition::Above;
    else if (price < vwap - 0.01)
        result.position = VwapPosition::Below;
    else
        result.position = VwapPosition::At;

    result.volume_weighted_price = candles.back().typical_price();
    return result;
}

double calculate_obv(CandleSpan candles) {
    if (candles.empty())
        return 0.0;
    if (candles.size() < 2)
        return static_cast<double>(candles.front().volume);

    double obv = 0;
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].close > candles[i - 1].close)
            obv += static_cast<double>(candles[i].volume);
        else if (candles[i].close < candles[i - 1].close)
            obv -= static_cast<double>(candles[i].volume);
    }
    return obv;
}

double calculate_vpt(CandleSpan candles) {
    double vpt = 0;
    for (size_t i = 1; i < candles.size(); ++i) {
        double previous = candles[i - 1].close;
        if (previous != 0)
            vpt += static_cast<double>(candles[i].volume) * (candles[i].close - previous) / previous;
    }
    return vpt;
}

double calculate_relative_volume(CandleSpan candles, int lookback) {
    if (candles.size() < 2 || lookback <= 0)
        return 1.0;

    auto history = candles.first(candles.size() - 1);
    history = history.last(std::min(history.size(), static_cast<size_t>(lookback)));

    double sum = 0;
    for (const auto& c : history) {
        sum += static_cast<double>(c.volume);
    }
    double average = sum / static_cast<double>(history.size());
    return average > 0 ? static_cast<double>(candles.back().volume) / average : 1.0;
}

TrendChange calculate_volume_trend(CandleSpan candles, int periods) {
    if (periods < 2 || candles.size() < static_cast<size_t>(periods))
        return TrendChange::Stable;

    auto recent = candles.last(static_cast<size_t>(periods));
    size_t half = static_cast<size_t>(periods) / 2;

    double first_sum = 0;
    double second_sum = 0;
    for (size_t i = 0; i < recent.size(); ++i) {
        if (i < half)
            first_sum += static_cast<double>(recent[i].volume);
        else
            second_sum += static_cast<double>(recent[i].volume);
    }
    double first_avg = first_sum / static_cast<double>(half);
    double second_avg = second_sum / static_cast<double>(recent.size() - half);

    if (first_avg <= 0)
        return second_avg > 0 ? TrendChange::Increasing : TrendChange::Stable;

    double ratio = second_avg / first_avg;
    if (ratio > 1.2)
        return TrendChange::Increasing;
    if (ratio < 0.8)
        return TrendChange::Decreasing;
    return TrendChange::Stable;
}

VolumeAnalysis analyze_volume(CandleSpan candles, const AnalysisConfig& config) {
    VolumeAnalysis result;
    if (candles.empty())
        return result;

    result.profile = build_volume_profile(candles, config.profile_levels);
    result.vwap = calculate_vwap(candles);
    result.relative_volume = calculate_relative_volume(
        candles, std::min(static_cast<int>(candles.size()), config.relative_volume_lookback));
    result.volume_trend = calculate_volume_trend(candles.last(std::min<size_t>(30, candles.size())),
                                                 config.volume_trend_periods);

    auto window = candles.last(std::min(candles.size(), static_cast<size_t>(std::max(config.obv_window, 1))));
    result.on_balance_volume = calculate_obv(window);
    result.volume_price_trend = calculate_vpt(window);
    return result;
}

} // namespace analysis
} // namespace zonetrader
