// =============================================================================
// tick_math.cpp - Tick grid arithmetic and price/tick conversion
// =============================================================================

#include "tickbook/tick_math.hpp"
#include <cmath>
#include <limits>

namespace tickbook {
namespace tick_math {

int32_t lower_usable_tick(int32_t tick, int32_t spacing) {
    if (spacing <= 0) {
        throw Error(errors::INVALID_TICK_SPACING,
                    "tick spacing must be positive, got " + std::to_string(spacing));
    }
    int64_t compressed = tick / spacing;
    // Division truncates toward zero; step down once for negative remainders
    if (tick < 0 && tick % spacing != 0) {
        --compressed;
    }
    int64_t usable = compressed * spacing;
    if (usable < std::numeric_limits<int32_t>::min()) {
        throw Error(errors::INVALID_TICK,
                    "no usable tick at or below " + std::to_string(tick));
    }
    return static_cast<int32_t>(usable);
}

long double sqrt_price_at_tick(int32_t tick) {
    return std::pow(1.0001L, static_cast<long double>(tick) / 2.0L);
}

int32_t tick_at_reserves(U128 reserve0, U128 reserve1) {
    if (reserve0 == 0) return MAX_TICK;
    if (reserve1 == 0) return MIN_TICK;

    // long double carries ~19 significant digits, enough to place the tick
    long double log_ratio = std::log(static_cast<long double>(reserve1)) -
                            std::log(static_cast<long double>(reserve0));
    long double tick = std::floor(log_ratio / std::log(1.0001L));

    if (tick < MIN_TICK) return MIN_TICK;
    if (tick > MAX_TICK) return MAX_TICK;
    return static_cast<int32_t>(tick);
}

} // namespace tick_math
} // namespace tickbook
