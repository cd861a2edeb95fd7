// =============================================================================
// hook.cpp - LimitOrderHook Implementation
// Order placement, claim redemption and the tick-crossing fill loop
// =============================================================================

#include "tickbook/hook.hpp"
#include "tickbook/full_math.hpp"
#include "tickbook/tick_math.hpp"

namespace tickbook {

// =============================================================================
// Constructor
// =============================================================================

LimitOrderHook::LimitOrderHook(const Address& address, Journal& journal, PoolManager& pool,
                               TokenLedger& tokens)
    : address_(address),
      journal_(journal),
      pool_(pool),
      ledger_(journal),
      claims_(journal, address),
      settlement_(tokens, pool) {}

HookPermissions LimitOrderHook::permissions() const {
    HookPermissions perms;
    perms.after_initialize = true;
    perms.after_swap = true;
    return perms;
}

int32_t LimitOrderHook::usable_tick(const PoolKey& key, int32_t tick) {
    if (!tick_math::is_valid_tick(tick)) {
        throw Error(errors::INVALID_TICK, "tick " + std::to_string(tick) + " out of range");
    }
    if (key.tick_spacing <= 0) {
        throw Error(errors::INVALID_TICK, "pool tick spacing must be positive");
    }
    return tick_math::lower_usable_tick(tick, key.tick_spacing);
}

// =============================================================================
// Place Order
// =============================================================================

int32_t LimitOrderHook::place_order(const Address& caller, const PoolKey& key, int32_t tick,
                                    bool zero_for_one, U128 amount) {
    if (amount == 0) {
        throw Error(errors::INVALID_AMOUNT, "order amount must be nonzero");
    }
    int32_t usable = usable_tick(key, tick);
    OrderId id = order_id(key, usable, zero_for_one);

    Transaction tx(journal_);

    ledger_.add_pending(key.id(), usable, zero_for_one, amount);
    ledger_.add_claim_supply(id, amount);
    claims_.mint(address_, caller, id, amount);
    settlement_.pull(input_currency(key, zero_for_one), caller, address_, amount);

    ++ledger_.stats().orders_placed;
    tx.commit();
    return usable;
}

// =============================================================================
// Cancel Order
// =============================================================================

void LimitOrderHook::cancel_order(const Address& caller, const PoolKey& key, int32_t tick,
                                  bool zero_for_one, U128 amount) {
    int32_t usable = usable_tick(key, tick);
    OrderId id = order_id(key, usable, zero_for_one);

    U128 balance = claims_.balance_of(caller, id);
    if (balance == 0) {
        throw Error(errors::NOTHING_TO_CLAIM, "no claims on order " + id.to_hex());
    }
    if (balance < amount) {
        throw Error(errors::NOT_ENOUGH_TO_CLAIM,
                    "holds " + to_string(balance) + " claims, cancelling " + to_string(amount));
    }
    if (amount == 0) {
        throw Error(errors::INVALID_AMOUNT, "cancel amount must be nonzero");
    }

    Transaction tx(journal_);

    // Only unfilled input can be withdrawn
    ledger_.remove_pending(key.id(), usable, zero_for_one, amount);
    ledger_.remove_claim_supply(id, amount);
    claims_.burn(address_, caller, id, amount);
    settlement_.push(input_currency(key, zero_for_one), address_, caller, amount);

    ++ledger_.stats().cancellations;
    tx.commit();
}

// =============================================================================
// Redeem
// =============================================================================

U128 LimitOrderHook::redeem(const Address& caller, const PoolKey& key, int32_t tick,
                            bool zero_for_one, U128 amount) {
    int32_t usable = usable_tick(key, tick);
    OrderId id = order_id(key, usable, zero_for_one);
    OrderInfo info = ledger_.order(id);

    if (info.claimable_output == 0) {
        throw Error(errors::NOTHING_TO_CLAIM, "no filled output on order " + id.to_hex());
    }
    U128 balance = claims_.balance_of(caller, id);
    if (balance < amount) {
        throw Error(errors::NOT_ENOUGH_TO_CLAIM,
                    "holds " + to_string(balance) + " claims, redeeming " + to_string(amount));
    }
    if (amount == 0) {
        throw Error(errors::INVALID_AMOUNT, "redeem amount must be nonzero");
    }

    // floor(amount * claimable / supply); supply >= balance >= amount > 0
    U128 share = full_math::mul_div(amount, info.claimable_output, info.claim_supply);

    Transaction tx(journal_);

    ledger_.remove_claimable_output(id, share);
    ledger_.remove_claim_supply(id, amount);
    claims_.burn(address_, caller, id, amount);
    settlement_.push(output_currency(key, zero_for_one), address_, caller, share);

    ++ledger_.stats().redemptions;
    tx.commit();
    return share;
}

// =============================================================================
// Pool Callbacks
// =============================================================================

void LimitOrderHook::after_initialize(const PoolKey& key, int32_t tick) {
    ledger_.set_last_tick(key.id(), tick_math::lower_usable_tick(tick, key.tick_spacing));
}

void LimitOrderHook::after_swap(const Address&, const PoolKey& key, const SwapParams&,
                                const BalanceDelta&) {
    // Our own fills land here too
    if (scanning_.count(key.id()) != 0) return;

    execute_crossed(key);
}

// =============================================================================
// Tick-Crossing Fill Loop
// =============================================================================
//
// Each pass compares the current usable tick with the last observed one and
// fills the nearest resting bucket in the crossed range, then re-reads the
// price the fill produced. The origin stays put until a pass finds nothing.
// Every fill drains one nonzero bucket, so the pool's nonzero bucket count at
// entry bounds the number of fills.

void LimitOrderHook::execute_crossed(const PoolKey& key) {
    const uint64_t pool_id = key.id();

    std::optional<Slot0> slot0 = pool_.get_slot0(key);
    if (!slot0) {
        throw Error(errors::POOL_NOT_INITIALIZED, "pool " + std::to_string(pool_id));
    }

    std::optional<int32_t> origin = ledger_.last_tick(pool_id);
    if (!origin) {
        ledger_.set_last_tick(pool_id, tick_math::lower_usable_tick(slot0->tick, key.tick_spacing));
        return;
    }

    ScanGuard guard(scanning_, pool_id);
    size_t budget = ledger_.nonzero_buckets(pool_id);

    for (;;) {
        int32_t current = tick_math::lower_usable_tick(pool_.get_slot0(key)->tick,
                                                       key.tick_spacing);

        // Price up: sell0 orders in [origin, current]; price down: sell1 orders in [current, origin]
        bool zero_for_one = current > *origin;
        std::optional<int32_t> hit;
        if (current != *origin) {
            hit = ledger_.first_pending(pool_id, zero_for_one, *origin, current);
        }

        if (!hit) {
            ledger_.set_last_tick(pool_id, current);
            return;
        }

        if (budget == 0) {
            throw Error(errors::FILL_BOUND_EXCEEDED,
                        "fill loop exceeded its bound on pool " + std::to_string(pool_id));
        }
        --budget;

        fill(key, *hit, zero_for_one);
    }
}

void LimitOrderHook::fill(const PoolKey& key, int32_t tick, bool zero_for_one) {
    const uint64_t pool_id = key.id();
    U128 amount = ledger_.pending(pool_id, tick, zero_for_one);
    if (amount > (U128_MAX >> 1)) {
        throw Error(errors::MATH_OVERFLOW, "bucket volume exceeds swap range");
    }

    SwapParams params{zero_for_one, static_cast<I128>(amount),
                      tick_math::extreme_limit(zero_for_one)};
    BalanceDelta delta = pool_.swap(address_, key, params);
    settlement_.settle_delta(address_, key, delta);

    I128 received = zero_for_one ? delta.amount1 : delta.amount0;
    U128 output = received < 0 ? static_cast<U128>(-received) : 0;

    OrderId id = order_id(key, tick, zero_for_one);
    ledger_.remove_pending(pool_id, tick, zero_for_one, amount);
    ledger_.add_claimable_output(id, output);

    OrderLedgerStats& stats = ledger_.stats();
    ++stats.fills;
    stats.filled_volume += amount;

    if (listener_) {
        listener_->on_order_filled(FillRecord{key, tick, zero_for_one, amount, output, id});
    }
}

// =============================================================================
// Query Operations
// =============================================================================

U128 LimitOrderHook::pending_orders(const PoolKey& key, int32_t tick, bool zero_for_one) const {
    return ledger_.pending(key.id(), usable_tick(key, tick), zero_for_one);
}

U128 LimitOrderHook::claim_supply(const OrderId& id) const {
    return ledger_.order(id).claim_supply;
}

U128 LimitOrderHook::claimable_output(const OrderId& id) const {
    return ledger_.order(id).claimable_output;
}

U128 LimitOrderHook::claim_balance(const Address& holder, const OrderId& id) const {
    return claims_.balance_of(holder, id);
}

std::optional<int32_t> LimitOrderHook::last_tick(const PoolKey& key) const {
    return ledger_.last_tick(key.id());
}

size_t LimitOrderHook::nonzero_buckets(const PoolKey& key) const {
    return ledger_.nonzero_buckets(key.id());
}

} // namespace tickbook
