// =============================================================================
// settlement.cpp - Settlement adapter between custody and the pool manager
// =============================================================================

#include "tickbook/settlement.hpp"

namespace tickbook {

Settlement::Settlement(TokenLedger& tokens, PoolManager& pool)
    : tokens_(tokens), pool_(pool) {}

U128 Settlement::balance_of(const Currency& currency, const Address& holder) const {
    return currency.is_native() ? tokens_.native_balance(holder)
                                : tokens_.balance_of(currency, holder);
}

void Settlement::pull(const Currency& currency, const Address& from, const Address& custody,
                      U128 amount) {
    if (amount == 0) return;

    if (currency.is_native()) {
        tokens_.send_value(from, custody, amount);
    } else {
        tokens_.transfer_from(currency, custody, from, custody, amount);
    }
}

void Settlement::push(const Currency& currency, const Address& custody, const Address& to,
                      U128 amount) {
    if (amount == 0) return;

    if (currency.is_native()) {
        tokens_.send_value(custody, to, amount);
    } else {
        tokens_.transfer(currency, custody, to, amount);
    }
}

// =============================================================================
// Delta Settlement
// =============================================================================

void Settlement::settle_currency(const Address& spender, const Address& payer,
                                 const Currency& currency, I128 amount) {
    if (amount > 0) {
        // Owed to the pool: pay in, then credit the payment
        U128 owed = static_cast<U128>(amount);
        pool_.sync(currency);
        if (currency.is_native()) {
            tokens_.send_value(payer, pool_.address(), owed);
        } else if (spender == payer) {
            tokens_.transfer(currency, payer, pool_.address(), owed);
        } else {
            tokens_.transfer_from(currency, spender, payer, pool_.address(), owed);
        }
        pool_.settle(payer, currency);
    } else if (amount < 0) {
        // Owed by the pool: withdraw
        pool_.take(payer, currency, payer, static_cast<U128>(-amount));
    }
}

void Settlement::settle_delta(const Address& account, const PoolKey& key,
                              const BalanceDelta& delta) {
    settle_currency(account, account, key.currency0, delta.amount0);
    settle_currency(account, account, key.currency1, delta.amount1);
}

void Settlement::settle_delta_from(const Address& spender, const Address& payer,
                                   const PoolKey& key, const BalanceDelta& delta) {
    settle_currency(spender, payer, key.currency0, delta.amount0);
    settle_currency(spender, payer, key.currency1, delta.amount1);
}

} // namespace tickbook
