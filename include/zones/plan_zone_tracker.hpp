#pragma once

#include "../market/candle.hpp"
#include "zone_types.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace zonetrader {
namespace zones {

/**
 * PlanZoneTracker - supply/demand bands from the latest swing pair
 *
 * With H the latest high pivot and L the latest low pivot (L.price < H.price):
 *   Supply: L precedes H and the last close is below L  -> [L, H]
 *   Demand: H precedes L and the last close is above H  -> [L, H]
 * The zone starts at the earlier pivot and is identified by that start.
 * A zone closes when a close breaks through it (Supply above high, Demand
 * below low). An older active zone engulfed by the newest zone of the same
 * kind is closed at the newer zone's start.
 */
class PlanZoneTracker {
public:
    explicit PlanZoneTracker(size_t max_history = 200) : max_history_(max_history) {}

    static std::optional<PlanZone> build_candidate(const std::vector<SwingPoint>& swings, Price last_close) {
        const SwingPoint* swing_high = nullptr;
        const SwingPoint* swing_low = nullptr;
        for (auto it = swings.rbegin(); it != swings.rend() && (!swing_high || !swing_low); ++it) {
            if (!swing_high && it->direction == Direction::Down)
                swing_high = &*it;
            else if (!swing_low && it->direction == Direction::Up)
                swing_low = &*it;
        }
        if (!swing_high || !swing_low || !(swing_low->price < swing_high->price))
            return std::nullopt;

        PlanZone zone;
        zone.low = swing_low->price;
        zone.high = swing_high->price;
        zone.start_timestamp = std::min(swing_low->timestamp, swing_high->timestamp);

        if (swing_low->timestamp < swing_high->timestamp && swing_low->price > last_close) {
            zone.kind = PlanZoneKind::Supply;
            return zone;
        }
        if (swing_low->timestamp > swing_high->timestamp && swing_high->price < last_close) {
            zone.kind = PlanZoneKind::Demand;
            return zone;
        }
        return std::nullopt;
    }

    /**
     * Apply one candle. Returns zones that were created or closed by it.
     */
    std::vector<PlanZone> update(std::vector<PlanZone>& zones, const std::vector<SwingPoint>& swings,
                                 const market::Candle& last) const {
        std::vector<PlanZone> before = zones;

        if (auto candidate = build_candidate(swings, last.close)) {
            bool seen = std::any_of(zones.begin(), zones.end(), [&](const PlanZone& z) {
                return z.start_timestamp == candidate->start_timestamp;
            });
            if (!seen)
                zones.push_back(*candidate);
        }

        for (auto& zone : zones) {
            close_out(zone, last);
        }
        merge_engulfed(zones);

        std::stable_sort(zones.begin(), zones.end(),
                         [](const PlanZone& a, const PlanZone& b) { return a.start_timestamp < b.start_timestamp; });

        std::vector<PlanZone> changed;
        for (const auto& zone : zones) {
            auto prior = std::find_if(before.begin(), before.end(), [&](const PlanZone& z) {
                return z.start_timestamp == zone.start_timestamp;
            });
            if (prior == before.end() || !(*prior == zone))
                changed.push_back(zone);
        }

        prune(zones, swings);
        return changed;
    }

private:
    size_t max_history_;

    static void close_out(PlanZone& zone, const market::Candle& candle) {
        if (!zone.is_active())
            return;
        if ((zone.kind == PlanZoneKind::Supply && candle.close > zone.high) ||
            (zone.kind == PlanZoneKind::Demand && candle.close < zone.low)) {
            zone.end_timestamp = candle.timestamp;
        }
    }

    static void merge_engulfed(std::vector<PlanZone>& zones) {
        auto newest = zones.end();
        for (auto it = zones.begin(); it != zones.end(); ++it) {
            if (it->is_active() && (newest == zones.end() || it->start_timestamp > newest->start_timestamp))
                newest = it;
        }
        if (newest == zones.end())
            return;

        for (auto it = zones.begin(); it != zones.end(); ++it) {
            if (it != newest && newest->engulfs(*it))
                it->end_timestamp = newest->start_timestamp;
        }
    }

    // Closed zones older than every retained swing can never be rebuilt
    void prune(std::vector<PlanZone>& zones, const std::vector<SwingPoint>& swings) const {
        if (zones.size() <= max_history_ || swings.empty())
            return;
        Timestamp oldest_swing = swings.front().timestamp;
        auto removable = [&](const PlanZone& z) { return !z.is_active() && z.start_timestamp < oldest_swing; };
        while (zones.size() > max_history_) {
            auto it = std::find_if(zones.begin(), zones.end(), removable);
            if (it == zones.end())
                break;
            zones.erase(it);
        }
    }
};

} // namespace zones
} // namespace zonetrader
