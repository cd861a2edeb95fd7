#ifndef TICKBOOK_ROUTER_HPP
#define TICKBOOK_ROUTER_HPP

#include "types.hpp"
#include "pool.hpp"
#include "token.hpp"
#include "settlement.hpp"

namespace tickbook {

// =============================================================================
// PoolRouter - user entry point for swaps and liquidity
// =============================================================================
//
// Runs each operation inside PoolManager::lock() and squares the user's
// deltas before the lock closes. Token payments are drawn with the user's
// allowance to the router.

class PoolRouter {
public:
    PoolRouter(const Address& address, PoolManager& pool, TokenLedger& tokens);

    BalanceDelta swap(const Address& user, const PoolKey& key, const SwapParams& params);

    BalanceDelta modify_liquidity(const Address& user, const PoolKey& key,
                                  const ModifyLiquidityParams& params);

    const Address& address() const { return address_; }

private:
    Address address_;
    PoolManager& pool_;
    Settlement settlement_;
};

} // namespace tickbook

#endif // TICKBOOK_ROUTER_HPP
