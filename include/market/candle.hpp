#pragma once

#include "../types.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace zonetrader {
namespace market {

// Body must exceed a tick to count as a directional candle
constexpr Price DOJI_THRESHOLD = 0.25;

/**
 * OHLCV candle. Immutable once produced by a CandleSource.
 */
struct Candle {
    Timestamp timestamp = 0; // open time (ms)
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;
    Volume volume = 0;
    Timestamp duration_ms = MS_PER_MINUTE;

    Timestamp end_time() const { return timestamp + duration_ms; }
    Price range() const { return high - low; }
    Price typical_price() const { return (high + low + close) / 3.0; }
    Price body_height() const { return std::abs(close - open); }

    bool is_bullish() const { return close - DOJI_THRESHOLD > open; }
    bool is_bearish() const { return close + DOJI_THRESHOLD < open; }
    bool is_doji() const { return !is_bullish() && !is_bearish(); }

    Direction direction() const {
        if (is_bullish())
            return Direction::Up;
        if (is_bearish())
            return Direction::Down;
        return Direction::Doji;
    }

    bool is_opposite(const Candle& other) const {
        return (is_bullish() && other.is_bearish()) || (is_bearish() && other.is_bullish());
    }

    // Body of this candle covers the body of the other
    bool engulfs(const Candle& other) const {
        Price top = std::max(open, close);
        Price bottom = std::min(open, close);
        return top >= std::max(other.open, other.close) && bottom <= std::min(other.open, other.close) &&
               body_height() > other.body_height();
    }

    bool operator==(const Candle& other) const = default;
};

namespace detail {
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        tokens.push_back(token);
    }
    return tokens;
}
} // namespace detail

/**
 * One `timestamp,open,high,low,close,volume` row. Timestamps below 1e11 are
 * taken as epoch seconds. Header and malformed rows yield nullopt.
 */
inline std::optional<Candle> parse_candle_csv_row(std::string line, Timestamp duration_ms = MS_PER_MINUTE) {
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    if (line.empty() || line.find("timestamp") != std::string::npos)
        return std::nullopt;

    auto tokens = detail::split_csv_line(line);
    if (tokens.size() < 6)
        return std::nullopt;

    Candle c;
    try {
        c.timestamp = std::stoll(tokens[0]);
        c.open = std::stod(tokens[1]);
        c.high = std::stod(tokens[2]);
        c.low = std::stod(tokens[3]);
        c.close = std::stod(tokens[4]);
        c.volume = static_cast<Volume>(std::stod(tokens[5]));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (c.timestamp < 100'000'000'000LL)
        c.timestamp *= MS_PER_SECOND;
    c.duration_ms = duration_ms;
    return c;
}

/**
 * Load candles from CSV
 *
 * Expected format (header optional):
 * timestamp,open,high,low,close,volume
 *
 * Rows are returned sorted by timestamp; malformed rows are skipped.
 */
inline std::vector<Candle> load_candles_csv(const std::string& filename, Timestamp duration_ms = MS_PER_MINUTE) {
    std::vector<Candle> candles;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        if (auto c = parse_candle_csv_row(line, duration_ms))
            candles.push_back(*c);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
    return candles;
}

inline void save_candles_csv(const std::string& filename, const std::vector<Candle>& candles) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "timestamp,open,high,low,close,volume\n";
    for (const auto& c : candles) {
        file << c.timestamp << "," << c.open << "," << c.high << "," << c.low << "," << c.close << "," << c.volume
             << "\n";
    }
}

} // namespace market
} // namespace zonetrader
