// =============================================================================
// types.cpp - Error codes and 128-bit formatting helpers
// =============================================================================

#include "tickbook/types.hpp"
#include <algorithm>

namespace tickbook {

namespace {

constexpr uint64_t X18_DIGITS = 18;

} // anonymous namespace

// =============================================================================
// Error
// =============================================================================

Error::Error(int32_t code, const std::string& message)
    : std::runtime_error(std::string(errors::name(code)) + ": " + message)
    , code_(code) {}

const char* errors::name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case POOL_NOT_INITIALIZED: return "POOL_NOT_INITIALIZED";
        case POOL_ALREADY_INITIALIZED: return "POOL_ALREADY_INITIALIZED";
        case INVALID_TICK: return "INVALID_TICK";
        case INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case PRICE_LIMIT_EXCEEDED: return "PRICE_LIMIT_EXCEEDED";
        case INVALID_CURRENCY: return "INVALID_CURRENCY";
        case CURRENCIES_NOT_SORTED: return "CURRENCIES_NOT_SORTED";
        case INVALID_FEE: return "INVALID_FEE";
        case INVALID_TICK_SPACING: return "INVALID_TICK_SPACING";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case MATH_OVERFLOW: return "MATH_OVERFLOW";
        case NOTHING_TO_CLAIM: return "NOTHING_TO_CLAIM";
        case NOT_ENOUGH_TO_CLAIM: return "NOT_ENOUGH_TO_CLAIM";
        case FILL_BOUND_EXCEEDED: return "FILL_BOUND_EXCEEDED";
        case INVALID_CONFIG: return "INVALID_CONFIG";
        case REENTRANCY: return "REENTRANCY";
        case HOOK_FAILED: return "HOOK_FAILED";
        case NOT_LOCKED: return "NOT_LOCKED";
        case UNSETTLED_DELTA: return "UNSETTLED_DELTA";
        case NOT_SYNCED: return "NOT_SYNCED";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case CRYPTO_FAILURE: return "CRYPTO_FAILURE";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// Formatting
// =============================================================================

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v >= 0) return to_string(static_cast<U128>(v));
    // -(v + 1) + 1 avoids overflow on the minimum value
    return "-" + to_string(static_cast<U128>(-(v + 1)) + 1);
}

std::string addresses::to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// X18 Decimal Conversion
// =============================================================================

U128 x18::parse(std::string_view text) {
    if (text.empty()) {
        throw Error(errors::INVALID_AMOUNT, "empty amount");
    }

    size_t dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if ((whole.empty() && frac.empty()) || frac.size() > X18_DIGITS) {
        throw Error(errors::INVALID_AMOUNT, "malformed amount '" + std::string(text) + "'");
    }

    U128 value = 0;
    auto push_digit = [&](char c) {
        if (c < '0' || c > '9') {
            throw Error(errors::INVALID_AMOUNT, "malformed amount '" + std::string(text) + "'");
        }
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) {
            throw Error(errors::MATH_OVERFLOW, "amount '" + std::string(text) + "' too large");
        }
        value = value * 10 + digit;
    };

    for (char c : whole) push_digit(c);
    for (char c : frac) push_digit(c);
    for (size_t i = frac.size(); i < X18_DIGITS; ++i) push_digit('0');
    return value;
}

std::string x18::format(U128 v) {
    const U128 one = static_cast<U128>(X18_ONE);
    std::string out = to_string(v / one);
    U128 rem = v % one;
    if (rem == 0) return out;

    std::string frac = to_string(rem);
    frac.insert(0, X18_DIGITS - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return out + "." + frac;
}

} // namespace tickbook
