#ifndef TICKBOOK_SETTLEMENT_HPP
#define TICKBOOK_SETTLEMENT_HPP

#include "types.hpp"
#include "token.hpp"
#include "pool.hpp"

namespace tickbook {

// =============================================================================
// Settlement - asset movement between callers, custody and the pool manager
// =============================================================================
//
// Stateless. The native currency (zero address) moves by raw value transfer,
// every other currency through the token ledger.

class Settlement {
public:
    Settlement(TokenLedger& tokens, PoolManager& pool);

    U128 balance_of(const Currency& currency, const Address& holder) const;

    // Move `amount` from `from` into `custody`. Tokens require an allowance
    // granted by `from` to `custody`.
    void pull(const Currency& currency, const Address& from, const Address& custody, U128 amount);

    // Move `amount` out of `custody` to `to`
    void push(const Currency& currency, const Address& custody, const Address& to, U128 amount);

    // Square `account`'s deltas for one pool operation. Must run inside
    // PoolManager::lock(). Positive amounts are paid in with sync/transfer/settle,
    // negative amounts are withdrawn to `account` with take.
    void settle_delta(const Address& account, const PoolKey& key, const BalanceDelta& delta);

    // Same, with the deltas owned by `payer` and paid in through `payer`'s
    // allowance to `spender` instead of a direct transfer
    void settle_delta_from(const Address& spender, const Address& payer, const PoolKey& key,
                           const BalanceDelta& delta);

private:
    void settle_currency(const Address& spender, const Address& payer,
                         const Currency& currency, I128 amount);

    TokenLedger& tokens_;
    PoolManager& pool_;
};

} // namespace tickbook

#endif // TICKBOOK_SETTLEMENT_HPP
