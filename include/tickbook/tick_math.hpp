#ifndef TICKBOOK_TICK_MATH_HPP
#define TICKBOOK_TICK_MATH_HPP

#include "types.hpp"

namespace tickbook {

// =============================================================================
// Tick Math Utilities
// =============================================================================

namespace tick_math {

// Minimum and maximum ticks
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

constexpr bool is_valid_tick(int32_t tick) {
    return tick >= MIN_TICK && tick <= MAX_TICK;
}

// Greatest multiple of spacing that is <= tick (floor, not truncation).
// Throws INVALID_TICK_SPACING for non-positive spacing, INVALID_TICK when
// the grid point would fall below INT32_MIN.
int32_t lower_usable_tick(int32_t tick, int32_t spacing);

// Widest price bound for a swap in the given direction
constexpr int32_t extreme_limit(bool zero_for_one) {
    return zero_for_one ? MIN_TICK + 1 : MAX_TICK - 1;
}

// sqrt(1.0001^tick)
long double sqrt_price_at_tick(int32_t tick);

// floor(log_1.0001(reserve1 / reserve0)), clamped to [MIN_TICK, MAX_TICK]
int32_t tick_at_reserves(U128 reserve0, U128 reserve1);

} // namespace tick_math

} // namespace tickbook

#endif // TICKBOOK_TICK_MATH_HPP
