// =============================================================================
// pool.cpp - PoolManager AMM Implementation (Uniswap v4-style)
// Full-range constant-product pools with flash accounting and hook dispatch
// =============================================================================

#include "tickbook/pool.hpp"
#include "tickbook/full_math.hpp"
#include "tickbook/tick_math.hpp"
#include <cmath>

namespace tickbook {

// =============================================================================
// Internal Constants
// =============================================================================

namespace {

constexpr U128 I128_MAX_AS_U128 = U128_MAX >> 1;

inline I128 to_signed(U128 v) {
    if (v > I128_MAX_AS_U128) {
        throw Error(errors::MATH_OVERFLOW, "amount exceeds signed 128-bit range");
    }
    return static_cast<I128>(v);
}

inline U128 magnitude(I128 v) {
    return v < 0 ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
}

inline U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw Error(errors::MATH_OVERFLOW, "reserve overflow");
    }
    return a + b;
}

// Reserve needed to back `liquidity` shares at a given sqrt price, rounded up
inline U128 initial_reserve(long double value) {
    long double rounded = std::ceil(value);
    if (!std::isfinite(rounded) || rounded >= static_cast<long double>(I128_MAX_AS_U128)) {
        throw Error(errors::MATH_OVERFLOW, "initial reserve out of range");
    }
    return static_cast<U128>(rounded);
}

// Clears the manager's lock flag on every exit path
struct LockFlag {
    explicit LockFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~LockFlag() { flag_ = false; }
    bool& flag_;
};

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolManager::PoolManager(const Address& address, Journal& journal, TokenLedger& tokens)
    : Versioned(journal), address_(address), tokens_(tokens) {}

// =============================================================================
// Internal Helpers
// =============================================================================

PoolState& PoolManager::require_pool(const PoolKey& key) {
    auto it = state_.pools.find(key.id());
    if (it == state_.pools.end()) {
        throw Error(errors::POOL_NOT_INITIALIZED, "pool " + std::to_string(key.id()));
    }
    return it->second;
}

const PoolState* PoolManager::get_pool(const PoolKey& key) const {
    auto it = state_.pools.find(key.id());
    return it != state_.pools.end() ? &it->second : nullptr;
}

const PoolManager::HookEntry* PoolManager::get_hooks(const PoolKey& key) const {
    if (addresses::is_zero(key.hooks)) return nullptr;
    auto it = hooks_.find(key.hooks);
    return it != hooks_.end() ? &it->second : nullptr;
}

void PoolManager::require_locked(const char* op) const {
    if (!locked_) {
        throw Error(errors::NOT_LOCKED, std::string(op) + " called outside lock()");
    }
}

void PoolManager::account_delta(const Address& account, const PoolKey& key,
                                const BalanceDelta& delta) {
    state_.currency_deltas[{account, key.currency0}] += delta.amount0;
    state_.currency_deltas[{account, key.currency1}] += delta.amount1;
}

U128 PoolManager::balance_of(const Currency& currency) const {
    return currency.is_native() ? tokens_.native_balance(address_)
                                : tokens_.balance_of(currency, address_);
}

// =============================================================================
// Initialize Pool
// =============================================================================

int32_t PoolManager::initialize(const PoolKey& key, int32_t tick) {
    if (!(key.currency0 < key.currency1)) {
        throw Error(errors::CURRENCIES_NOT_SORTED, "currency0 must sort below currency1");
    }
    if (key.fee > fees::FEE_MAX) {
        throw Error(errors::INVALID_FEE, "fee " + std::to_string(key.fee) + " above maximum");
    }
    if (key.tick_spacing <= 0) {
        throw Error(errors::INVALID_TICK_SPACING, "tick spacing must be positive");
    }
    if (!tick_math::is_valid_tick(tick)) {
        throw Error(errors::INVALID_TICK, "initial tick " + std::to_string(tick));
    }

    const HookEntry* hooks = get_hooks(key);
    if (!addresses::is_zero(key.hooks) && !hooks) {
        throw Error(errors::HOOK_FAILED, "no hooks registered at " + addresses::to_hex(key.hooks));
    }

    Transaction tx(journal());

    if (hooks && hooks->permissions.before_initialize &&
        !hooks->hooks->before_initialize(key, tick)) {
        throw Error(errors::HOOK_FAILED, "before_initialize rejected pool");
    }

    if (state_.pools.find(key.id()) != state_.pools.end()) {
        throw Error(errors::POOL_ALREADY_INITIALIZED, "pool " + std::to_string(key.id()));
    }

    PoolState pool{};
    pool.key = key;
    pool.slot0.tick = tick;
    pool.slot0.lp_fee = key.fee;
    pool.reserve0 = 0;
    pool.reserve1 = 0;
    pool.liquidity = 0;
    state_.pools.emplace(key.id(), std::move(pool));

    if (hooks && hooks->permissions.after_initialize) {
        hooks->hooks->after_initialize(key, tick);
    }

    tx.commit();
    return tick;
}

// =============================================================================
// Swap Computation (constant product, fee on input)
// =============================================================================

PoolManager::SwapResult PoolManager::compute_swap(const PoolState& pool, bool zero_for_one,
                                                  I128 amount_specified) {
    U128 reserve_in = zero_for_one ? pool.reserve0 : pool.reserve1;
    U128 reserve_out = zero_for_one ? pool.reserve1 : pool.reserve0;
    if (pool.liquidity == 0 || reserve_in == 0 || reserve_out == 0) {
        throw Error(errors::INSUFFICIENT_LIQUIDITY, "pool has no liquidity");
    }

    const U128 fee_complement = fees::FEE_DENOMINATOR - pool.slot0.lp_fee;
    SwapResult result{};

    if (amount_specified > 0) {
        // Exact input
        result.amount_in = static_cast<U128>(amount_specified);
        U128 in_after_fee = full_math::mul_div(result.amount_in, fee_complement,
                                               fees::FEE_DENOMINATOR);
        result.amount_out = full_math::mul_div(reserve_out, in_after_fee,
                                               checked_add(reserve_in, in_after_fee));
    } else {
        // Exact output
        result.amount_out = magnitude(amount_specified);
        if (result.amount_out >= reserve_out) {
            throw Error(errors::INSUFFICIENT_LIQUIDITY,
                        "requested output " + to_string(result.amount_out) + " exceeds reserves");
        }
        U128 in_after_fee = full_math::mul_div_up(reserve_in, result.amount_out,
                                                  reserve_out - result.amount_out);
        result.amount_in = full_math::mul_div_up(in_after_fee, fees::FEE_DENOMINATOR,
                                                 fee_complement);
    }

    return result;
}

// =============================================================================
// Swap
// =============================================================================

BalanceDelta PoolManager::swap(const Address& sender, const PoolKey& key,
                               const SwapParams& params) {
    require_locked("swap");

    if (params.amount_specified == 0) {
        throw Error(errors::INVALID_AMOUNT, "swap amount must be nonzero");
    }
    if (!tick_math::is_valid_tick(params.tick_limit)) {
        throw Error(errors::INVALID_TICK, "tick limit " + std::to_string(params.tick_limit));
    }

    const HookEntry* hooks = get_hooks(key);
    if (hooks && hooks->permissions.before_swap &&
        !hooks->hooks->before_swap(sender, key, params)) {
        throw Error(errors::HOOK_FAILED, "before_swap rejected swap");
    }

    // Looked up after before_swap: the hook may have touched the pool map
    PoolState& pool = require_pool(key);

    // Validate price limit against the current tick
    if (params.zero_for_one ? params.tick_limit > pool.slot0.tick
                            : params.tick_limit < pool.slot0.tick) {
        throw Error(errors::PRICE_LIMIT_EXCEEDED,
                    "tick limit " + std::to_string(params.tick_limit) +
                    " already passed at tick " + std::to_string(pool.slot0.tick));
    }

    SwapResult step = compute_swap(pool, params.zero_for_one, params.amount_specified);

    U128 reserve0 = pool.reserve0;
    U128 reserve1 = pool.reserve1;
    if (params.zero_for_one) {
        reserve0 = checked_add(reserve0, step.amount_in);
        reserve1 -= step.amount_out;
    } else {
        reserve1 = checked_add(reserve1, step.amount_in);
        reserve0 -= step.amount_out;
    }

    int32_t tick = tick_math::tick_at_reserves(reserve0, reserve1);
    if (params.zero_for_one ? tick < params.tick_limit : tick > params.tick_limit) {
        throw Error(errors::PRICE_LIMIT_EXCEEDED,
                    "swap would move tick to " + std::to_string(tick) +
                    " past limit " + std::to_string(params.tick_limit));
    }

    // Persist state changes
    pool.reserve0 = reserve0;
    pool.reserve1 = reserve1;
    pool.slot0.tick = tick;

    BalanceDelta delta{};
    if (params.zero_for_one) {
        // Sold currency0, bought currency1
        delta.amount0 = to_signed(step.amount_in);
        delta.amount1 = -to_signed(step.amount_out);
    } else {
        // Sold currency1, bought currency0
        delta.amount0 = -to_signed(step.amount_out);
        delta.amount1 = to_signed(step.amount_in);
    }

    account_delta(sender, key, delta);
    ++state_.total_swaps;

    // Dispatched after state is persisted so the hook can trade again
    if (hooks && hooks->permissions.after_swap) {
        hooks->hooks->after_swap(sender, key, params, delta);
    }

    return delta;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

BalanceDelta PoolManager::modify_liquidity(const Address& sender, const PoolKey& key,
                                           const ModifyLiquidityParams& params) {
    require_locked("modify_liquidity");

    if (params.liquidity_delta == 0) {
        throw Error(errors::INVALID_AMOUNT, "liquidity delta must be nonzero");
    }

    const HookEntry* hooks = get_hooks(key);
    if (hooks && hooks->permissions.before_modify_liquidity &&
        !hooks->hooks->before_modify_liquidity(sender, key, params)) {
        throw Error(errors::HOOK_FAILED, "before_modify_liquidity rejected change");
    }

    PoolState& pool = require_pool(key);
    PositionInfo& position = pool.positions[{sender, params.salt}];
    U128 shares = magnitude(params.liquidity_delta);

    U128 amount0 = 0;
    U128 amount1 = 0;
    BalanceDelta delta{};

    if (params.liquidity_delta > 0) {
        if (pool.liquidity == 0) {
            // First deposit sizes reserves from the current price:
            // reserve0 = L / sqrt(P), reserve1 = L * sqrt(P)
            long double sqrt_price = tick_math::sqrt_price_at_tick(pool.slot0.tick);
            amount0 = initial_reserve(static_cast<long double>(shares) / sqrt_price);
            amount1 = initial_reserve(static_cast<long double>(shares) * sqrt_price);
        } else {
            // Proportional, rounded in the pool's favor
            amount0 = full_math::mul_div_up(pool.reserve0, shares, pool.liquidity);
            amount1 = full_math::mul_div_up(pool.reserve1, shares, pool.liquidity);
        }
        pool.reserve0 = checked_add(pool.reserve0, amount0);
        pool.reserve1 = checked_add(pool.reserve1, amount1);
        pool.liquidity = checked_add(pool.liquidity, shares);
        position.liquidity += shares;
        delta = {to_signed(amount0), to_signed(amount1)};
    } else {
        if (position.liquidity < shares) {
            throw Error(errors::INSUFFICIENT_LIQUIDITY,
                        "position holds " + to_string(position.liquidity) +
                        " shares, cannot remove " + to_string(shares));
        }
        if (shares == pool.liquidity) {
            // Last shares out take everything, including rounding dust
            amount0 = pool.reserve0;
            amount1 = pool.reserve1;
        } else {
            amount0 = full_math::mul_div(pool.reserve0, shares, pool.liquidity);
            amount1 = full_math::mul_div(pool.reserve1, shares, pool.liquidity);
        }
        pool.reserve0 -= amount0;
        pool.reserve1 -= amount1;
        pool.liquidity -= shares;
        position.liquidity -= shares;
        delta = {-to_signed(amount0), -to_signed(amount1)};
    }

    account_delta(sender, key, delta);
    ++state_.total_liquidity_ops;

    if (hooks && hooks->permissions.after_modify_liquidity) {
        hooks->hooks->after_modify_liquidity(sender, key, params, delta);
    }

    return delta;
}

// =============================================================================
// Flash Accounting
// =============================================================================

void PoolManager::lock(const LockCallback& callback) {
    if (locked_) {
        throw Error(errors::REENTRANCY, "pool manager already locked");
    }

    Transaction tx(journal());
    LockFlag flag(locked_);

    callback();

    // Verify all deltas settled to zero
    for (const auto& [entry, delta] : state_.currency_deltas) {
        if (delta != 0) {
            throw Error(errors::UNSETTLED_DELTA,
                        addresses::to_hex(entry.first) + " owes " + to_string(delta) +
                        " of " + addresses::to_hex(entry.second.addr));
        }
    }

    state_.currency_deltas.clear();
    state_.synced.clear();
    tx.commit();
}

void PoolManager::take(const Address& account, const Currency& currency,
                       const Address& to, U128 amount) {
    require_locked("take");

    if (currency.is_native()) {
        tokens_.send_value(address_, to, amount);
    } else {
        tokens_.transfer(currency, address_, to, amount);
    }
    // Taking creates debt (positive delta = pool is owed)
    state_.currency_deltas[{account, currency}] += to_signed(amount);
}

void PoolManager::sync(const Currency& currency) {
    require_locked("sync");
    state_.synced[currency] = balance_of(currency);
}

U128 PoolManager::settle(const Address& account, const Currency& currency) {
    require_locked("settle");

    auto it = state_.synced.find(currency);
    if (it == state_.synced.end()) {
        throw Error(errors::NOT_SYNCED, "settle without sync for " + addresses::to_hex(currency.addr));
    }
    U128 paid = balance_of(currency) - it->second;
    state_.synced.erase(it);

    state_.currency_deltas[{account, currency}] -= to_signed(paid);
    return paid;
}

I128 PoolManager::currency_delta(const Address& account, const Currency& currency) const {
    auto it = state_.currency_deltas.find({account, currency});
    return it != state_.currency_deltas.end() ? it->second : 0;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Slot0> PoolManager::get_slot0(const PoolKey& key) const {
    const PoolState* pool = get_pool(key);
    return pool ? std::optional<Slot0>{pool->slot0} : std::nullopt;
}

std::optional<std::pair<U128, U128>> PoolManager::get_reserves(const PoolKey& key) const {
    const PoolState* pool = get_pool(key);
    if (!pool) return std::nullopt;
    return std::make_pair(pool->reserve0, pool->reserve1);
}

std::optional<U128> PoolManager::get_liquidity(const PoolKey& key) const {
    const PoolState* pool = get_pool(key);
    return pool ? std::optional<U128>{pool->liquidity} : std::nullopt;
}

std::optional<PositionInfo> PoolManager::get_position(const PoolKey& key, const Address& owner,
                                                      uint64_t salt) const {
    const PoolState* pool = get_pool(key);
    if (!pool) return std::nullopt;

    auto it = pool->positions.find({owner, salt});
    return it != pool->positions.end() ? std::optional<PositionInfo>{it->second} : std::nullopt;
}

bool PoolManager::pool_exists(const PoolKey& key) const {
    return get_pool(key) != nullptr;
}

// =============================================================================
// Hook Registration
// =============================================================================

void PoolManager::register_hooks(const Address& hook_addr, IHooks* hooks) {
    if (!hooks || addresses::is_zero(hook_addr)) return;
    hooks_[hook_addr] = HookEntry{hooks, hooks->permissions()};
}

// =============================================================================
// Statistics
// =============================================================================

PoolManager::Stats PoolManager::get_stats() const {
    return Stats{
        static_cast<uint64_t>(state_.pools.size()),
        state_.total_swaps,
        state_.total_liquidity_ops
    };
}

} // namespace tickbook
