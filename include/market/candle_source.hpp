#pragma once

/**
 * Candle sources
 *
 * A source streams candles in timestamp order for [start, end]. Bounded
 * sources return once the range is exhausted; the live feed blocks for more
 * until it is closed. The sink returns false to stop the stream early.
 */

#include "candle.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace zonetrader {
namespace market {

using CandleSink = std::function<bool(const Candle&)>;

class ICandleSource {
public:
    virtual ~ICandleSource() = default;

    /**
     * Stream candles with start <= timestamp <= end into the sink.
     * Returns the number of candles delivered.
     */
    virtual size_t stream(Timestamp start, Timestamp end, const CandleSink& sink) = 0;
};

/**
 * In-memory bounded source over a sorted candle vector.
 */
class VectorCandleSource : public ICandleSource {
public:
    VectorCandleSource() = default;

    explicit VectorCandleSource(std::vector<Candle> candles) : candles_(std::move(candles)) {
        std::stable_sort(candles_.begin(), candles_.end(),
                         [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
    }

    size_t stream(Timestamp start, Timestamp end, const CandleSink& sink) override {
        auto it = std::lower_bound(candles_.begin(), candles_.end(), start,
                                   [](const Candle& c, Timestamp ts) { return c.timestamp < ts; });
        size_t delivered = 0;
        for (; it != candles_.end() && it->timestamp <= end; ++it) {
            ++delivered;
            if (!sink(*it))
                break;
        }
        return delivered;
    }

    const std::vector<Candle>& candles() const { return candles_; }
    size_t size() const { return candles_.size(); }

    Timestamp first_timestamp() const { return candles_.empty() ? NO_TIMESTAMP : candles_.front().timestamp; }
    Timestamp last_timestamp() const { return candles_.empty() ? NO_TIMESTAMP : candles_.back().timestamp; }

protected:
    std::vector<Candle> candles_;
};

/**
 * CSV-backed bounded source. The whole file is loaded at construction.
 */
class CsvCandleSource : public VectorCandleSource {
public:
    explicit CsvCandleSource(const std::string& filename, Timestamp duration_ms = MS_PER_MINUTE)
        : VectorCandleSource(load_candles_csv(filename, duration_ms)), filename_(filename) {}

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * Open-ended live feed. Producers push candles; stream() blocks waiting for
 * more until close() is called or the sink stops it. Candles older than the
 * last delivered timestamp are discarded to keep the stream non-decreasing.
 */
class LiveCandleFeed : public ICandleSource {
public:
    void push(const Candle& candle) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return;
            queue_.push_back(candle);
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t stream(Timestamp start, Timestamp end, const CandleSink& sink) override {
        size_t delivered = 0;
        Timestamp last = NO_TIMESTAMP;
        while (true) {
            Candle candle;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                if (queue_.empty())
                    return delivered; // closed and drained
                candle = queue_.front();
                queue_.pop_front();
            }
            if (candle.timestamp < start || candle.timestamp < last)
                continue;
            if (candle.timestamp > end)
                return delivered;
            last = candle.timestamp;
            ++delivered;
            if (!sink(candle))
                return delivered;
        }
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Candle> queue_;
    bool closed_ = false;
};

} // namespace market
} // namespace zonetrader
