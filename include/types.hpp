#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace zonetrader {

// Epoch milliseconds (UTC)
using Timestamp = int64_t;
using Price = double;
using Volume = int64_t;
using OrderId = uint64_t;

constexpr Timestamp NO_TIMESTAMP = std::numeric_limits<Timestamp>::min();
constexpr OrderId INVALID_ORDER_ID = 0;

constexpr Timestamp MS_PER_SECOND = 1000;
constexpr Timestamp MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr Timestamp MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr Timestamp MS_PER_DAY = 24 * MS_PER_HOUR;

// ES/MES tick size
constexpr Price TICK_SIZE = 0.25;

enum class OrderType : uint8_t { Long = 0, Short = 1 };

enum class Direction : uint8_t { Up = 0, Down = 1, Doji = 2 };

inline const char* order_type_to_string(OrderType type) {
    switch (type) {
    case OrderType::Long:
        return "Long";
    case OrderType::Short:
        return "Short";
    default:
        return "Unknown";
    }
}

inline const char* direction_to_string(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return "Up";
    case Direction::Down:
        return "Down";
    case Direction::Doji:
        return "Doji";
    default:
        return "Unknown";
    }
}

} // namespace zonetrader
