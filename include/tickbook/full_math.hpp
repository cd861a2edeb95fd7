#ifndef TICKBOOK_FULL_MATH_HPP
#define TICKBOOK_FULL_MATH_HPP

#include "types.hpp"

namespace tickbook {

// =============================================================================
// 256-bit intermediate arithmetic for 128-bit amounts
// =============================================================================

namespace full_math {

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}
};

// Full 128x128 -> 256 product
U256 mul_wide(U128 a, U128 b);

// floor(a * b / denom). Throws MATH_OVERFLOW if denom is zero or the
// quotient does not fit in 128 bits.
U128 mul_div(U128 a, U128 b, U128 denom);

// ceil(a * b / denom)
U128 mul_div_up(U128 a, U128 b, U128 denom);

} // namespace full_math

} // namespace tickbook

#endif // TICKBOOK_FULL_MATH_HPP
