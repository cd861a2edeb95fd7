// =============================================================================
// full_math.cpp - mul_div with 256-bit intermediate
// =============================================================================

#include "tickbook/full_math.hpp"

namespace tickbook {
namespace full_math {

namespace {

// Quotient and remainder of a 256-bit value by a 128-bit divisor.
// Requires num.hi < denom so that the quotient fits in 128 bits.
void div_rem(const U256& num, U128 denom, U128& quot, U128& rem) {
    if (num.hi == 0) {
        quot = num.lo / denom;
        rem = num.lo % denom;
        return;
    }

    // Restoring long division over the low limb; rem starts as the high limb
    // and stays below denom, so every step yields a single quotient bit.
    U128 r = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (carry || r >= denom) {
            r -= denom;
            q |= 1;
        }
    }
    quot = q;
    rem = r;
}

} // anonymous namespace

U256 mul_wide(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle column with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) {
        throw Error(errors::MATH_OVERFLOW, "mul_div by zero");
    }
    U256 product = mul_wide(a, b);
    if (product.hi >= denom) {
        throw Error(errors::MATH_OVERFLOW, "mul_div result exceeds 128 bits");
    }
    U128 quot = 0;
    U128 rem = 0;
    div_rem(product, denom, quot, rem);
    return quot;
}

U128 mul_div_up(U128 a, U128 b, U128 denom) {
    if (denom == 0) {
        throw Error(errors::MATH_OVERFLOW, "mul_div_up by zero");
    }
    U256 product = mul_wide(a, b);
    if (product.hi >= denom) {
        throw Error(errors::MATH_OVERFLOW, "mul_div_up result exceeds 128 bits");
    }
    U128 quot = 0;
    U128 rem = 0;
    div_rem(product, denom, quot, rem);
    if (rem != 0) {
        if (quot == U128_MAX) {
            throw Error(errors::MATH_OVERFLOW, "mul_div_up result exceeds 128 bits");
        }
        ++quot;
    }
    return quot;
}

} // namespace full_math
} // namespace tickbook
