#ifndef TICKBOOK_TYPES_HPP
#define TICKBOOK_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>

namespace tickbook {

// =============================================================================
// Addresses (EVM-style 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Deterministic address from a small integer id (accounts, tokens, contracts)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Well-known contract identities used by the simulator
constexpr Address POOL_MANAGER = from_id(0x9010);
constexpr Address ROUTER       = from_id(0x9012);
constexpr Address LIMIT_HOOK   = from_id(0x9013);

std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~static_cast<U128>(0);
constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

namespace x18 {

inline U128 from_int(uint64_t v) {
    return static_cast<U128>(v) * static_cast<U128>(X18_ONE);
}

// Parse plain decimal strings ("12", "0.01") into X18 units.
// Throws Error(INVALID_AMOUNT) on malformed input or more than 18 decimals.
U128 parse(std::string_view text);

// Format X18 units as a decimal string ("0.01")
std::string format(U128 v);

} // namespace x18

std::string to_string(U128 v);
std::string to_string(I128 v);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    // address(0) designates the chain-native asset
    bool is_native() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

inline const Currency NATIVE{};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip (3000 = 0.30%)
    int32_t tick_spacing;
    Address hooks;           // Hook contract address (0 = no hooks)

    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_spacing));
        for (auto b : hooks) h = h * 31 + b;
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
};

namespace fees {
constexpr uint32_t FEE_005 = 500;      // 0.05%
constexpr uint32_t FEE_030 = 3000;     // 0.30%
constexpr uint32_t FEE_MAX = 100000;   // 10.00%
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

// =============================================================================
// Balance Delta (Signed Token Amounts)
// =============================================================================

// Positive amounts are owed to the pool, negative amounts are owed by it.
struct BalanceDelta {
    I128 amount0;
    I128 amount1;
};

// =============================================================================
// Swap / Liquidity Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell currency0 for currency1
    I128 amount_specified;   // positive = exact input, negative = exact output
    int32_t tick_limit;      // swap reverts if the resulting tick passes this bound
};

struct ModifyLiquidityParams {
    I128 liquidity_delta;    // positive = add, negative = remove
    uint64_t salt;           // distinguishes positions of one owner
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t INVALID_TICK = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t PRICE_LIMIT_EXCEEDED = -5;
constexpr int32_t INVALID_CURRENCY = -6;
constexpr int32_t CURRENCIES_NOT_SORTED = -7;
constexpr int32_t INVALID_FEE = -8;
constexpr int32_t INVALID_TICK_SPACING = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t INVALID_AMOUNT = -12;
constexpr int32_t MATH_OVERFLOW = -13;
constexpr int32_t NOTHING_TO_CLAIM = -16;
constexpr int32_t NOT_ENOUGH_TO_CLAIM = -17;
constexpr int32_t FILL_BOUND_EXCEEDED = -18;
constexpr int32_t INVALID_CONFIG = -19;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t HOOK_FAILED = -31;
constexpr int32_t NOT_LOCKED = -32;
constexpr int32_t UNSETTLED_DELTA = -33;
constexpr int32_t NOT_SYNCED = -34;
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t CRYPTO_FAILURE = -41;

const char* name(int32_t code);
}

// Every failing operation throws Error; the enclosing Transaction discards
// all state written before the throw.
class Error : public std::runtime_error {
public:
    Error(int32_t code, const std::string& message);

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace tickbook

#endif // TICKBOOK_TYPES_HPP
