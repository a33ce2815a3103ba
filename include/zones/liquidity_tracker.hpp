#pragma once

#include "../market/candle.hpp"
#include "../util/market_calendar.hpp"
#include "zone_types.hpp"

#include <algorithm>
#include <vector>

namespace zonetrader {
namespace zones {

/**
 * LiquidityZoneTracker - session high/low extremes for NewYork, Asia, London
 *
 * While a candle is inside a market's session window (computed from the
 * stream's trading day) the High extreme only grows and the Low extreme only
 * shrinks. An active extreme outside its session is closed by the first
 * candle that trades through it; a new session closes a still-active
 * extreme of the same (market, kind) from an earlier session. At most one
 * extreme per (market, kind) is active at any time.
 *
 * A replay pins its trading day and streams the prior day's NewYork
 * session under it. A live stream derives the day from each candle and
 * is still on the session's own date while New York trades, so it passes
 * same_day_new_york to also track the trading day's own NewYork window.
 *
 * The tracker owns no state: the extreme list lives in the StreamState and
 * is mutated in place by the single writer.
 */
class LiquidityZoneTracker {
public:
    explicit LiquidityZoneTracker(size_t max_history = 60) : max_history_(max_history) {}

    /**
     * Apply one candle. Returns the post-change value of every extreme that
     * was created, extended or closed, in the order the changes happened.
     */
    std::vector<LiquidityExtreme> update(std::vector<LiquidityExtreme>& extremes, const market::Candle& candle,
                                         const util::Date& trading_day, bool same_day_new_york = false) const {
        std::vector<LiquidityExtreme> changed;
        std::vector<size_t> in_session; // extremes owned by a window containing this candle

        std::vector<util::SessionWindow> windows;
        for (const auto& window : util::session_windows(trading_day))
            windows.push_back(window);
        if (same_day_new_york)
            windows.push_back(util::new_york_window(trading_day));

        for (const auto& window : windows) {
            if (!window.contains(candle.timestamp))
                continue;
            for (ExtremeKind kind : {ExtremeKind::High, ExtremeKind::Low}) {
                size_t index = update_in_session(extremes, window, kind, candle, changed);
                in_session.push_back(index);
            }
        }

        // Liquidity taken: price trades through an extreme whose session is over
        for (size_t i = 0; i < extremes.size(); ++i) {
            auto& extreme = extremes[i];
            if (!extreme.is_active() || std::find(in_session.begin(), in_session.end(), i) != in_session.end())
                continue;
            bool surpassed = extreme.kind == ExtremeKind::High ? candle.high > extreme.level
                                                               : candle.low < extreme.level;
            if (surpassed) {
                extreme.end_timestamp = candle.timestamp;
                changed.push_back(extreme);
            }
        }

        prune(extremes);
        return changed;
    }

    static size_t active_count(const std::vector<LiquidityExtreme>& extremes, Market market, ExtremeKind kind) {
        return static_cast<size_t>(std::count_if(extremes.begin(), extremes.end(), [&](const LiquidityExtreme& e) {
            return e.is_active() && e.market == market && e.kind == kind;
        }));
    }

private:
    size_t max_history_;

    static size_t update_in_session(std::vector<LiquidityExtreme>& extremes, const util::SessionWindow& window,
                                    ExtremeKind kind, const market::Candle& candle,
                                    std::vector<LiquidityExtreme>& changed) {
        Price level = kind == ExtremeKind::High ? candle.high : candle.low;

        auto active = std::find_if(extremes.begin(), extremes.end(), [&](const LiquidityExtreme& e) {
            return e.is_active() && e.market == window.market && e.kind == kind;
        });

        if (active != extremes.end()) {
            if (active->start_timestamp >= window.start) {
                bool extends = kind == ExtremeKind::High ? level > active->level : level < active->level;
                if (extends) {
                    active->level = level;
                    changed.push_back(*active);
                }
                return static_cast<size_t>(active - extremes.begin());
            }
            // Left over from an earlier session
            active->end_timestamp = candle.timestamp;
            changed.push_back(*active);
        }

        LiquidityExtreme created;
        created.market = window.market;
        created.kind = kind;
        created.level = level;
        created.start_timestamp = candle.timestamp;
        extremes.push_back(created);
        changed.push_back(created);
        return extremes.size() - 1;
    }

    // Drop the oldest closed extremes beyond the history cap
    void prune(std::vector<LiquidityExtreme>& extremes) const {
        while (extremes.size() > max_history_) {
            auto oldest_closed = std::find_if(extremes.begin(), extremes.end(),
                                              [](const LiquidityExtreme& e) { return !e.is_active(); });
            if (oldest_closed == extremes.end())
                break;
            extremes.erase(oldest_closed);
        }
    }
};

} // namespace zones
} // namespace zonetrader
