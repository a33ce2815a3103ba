#pragma once

#include "../types.hpp"

#include <atomic>
#include <cstdint>

namespace zonetrader {
namespace security {

/**
 * RateLimiter - client-side request throttle for the broker REST API
 *
 * Fixed one-second windows: at most `requests_per_second` requests are let
 * through per window. Callers that are refused wait until the next window
 * (see wait_ms) instead of provoking a 429 from the venue.
 */
class RateLimiter {
public:
    static constexpr uint32_t DEFAULT_REQUESTS_PER_SECOND = 10;

    struct Config {
        uint32_t requests_per_second = DEFAULT_REQUESTS_PER_SECOND;
        bool enabled = true;
    };

    RateLimiter() : RateLimiter(Config{}) {}
    explicit RateLimiter(const Config& config)
        : config_(config), requests_this_second_(0), current_second_(0), rejected_(0) {}

    // Check if a request may go out now (epoch ms)
    bool allow_request(Timestamp now_ms) {
        if (!config_.enabled)
            return true;

        Timestamp second = now_ms / MS_PER_SECOND;
        Timestamp last = current_second_.load(std::memory_order_relaxed);
        if (second > last && current_second_.compare_exchange_strong(last, second, std::memory_order_relaxed)) {
            requests_this_second_.store(0, std::memory_order_relaxed);
        }

        uint32_t count = requests_this_second_.fetch_add(1, std::memory_order_relaxed);
        if (count >= config_.requests_per_second) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    // Milliseconds until the next window opens
    static Timestamp wait_ms(Timestamp now_ms) { return MS_PER_SECOND - (now_ms % MS_PER_SECOND); }

    uint64_t rejected_count() const { return rejected_.load(std::memory_order_relaxed); }

    void set_enabled(bool enabled) { config_.enabled = enabled; }
    bool is_enabled() const { return config_.enabled; }
    void set_rate_limit(uint32_t requests_per_second) { config_.requests_per_second = requests_per_second; }

private:
    Config config_;
    std::atomic<uint32_t> requests_this_second_;
    std::atomic<Timestamp> current_second_;
    std::atomic<uint64_t> rejected_;
};

} // namespace security
} // namespace zonetrader
