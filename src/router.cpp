// =============================================================================
// router.cpp - PoolRouter Implementation
// =============================================================================

#include "tickbook/router.hpp"

namespace tickbook {

PoolRouter::PoolRouter(const Address& address, PoolManager& pool, TokenLedger& tokens)
    : address_(address), pool_(pool), settlement_(tokens, pool) {}

BalanceDelta PoolRouter::swap(const Address& user, const PoolKey& key, const SwapParams& params) {
    BalanceDelta delta{};
    pool_.lock([&]() {
        delta = pool_.swap(user, key, params);
        settlement_.settle_delta_from(address_, user, key, delta);
    });
    return delta;
}

BalanceDelta PoolRouter::modify_liquidity(const Address& user, const PoolKey& key,
                                          const ModifyLiquidityParams& params) {
    BalanceDelta delta{};
    pool_.lock([&]() {
        delta = pool_.modify_liquidity(user, key, params);
        settlement_.settle_delta_from(address_, user, key, delta);
    });
    return delta;
}

} // namespace tickbook
