#ifndef TICKBOOK_HOOK_HPP
#define TICKBOOK_HOOK_HPP

#include <optional>
#include <unordered_set>

#include "types.hpp"
#include "journal.hpp"
#include "pool.hpp"
#include "token.hpp"
#include "claims.hpp"
#include "order_id.hpp"
#include "order_ledger.hpp"
#include "settlement.hpp"

namespace tickbook {

// =============================================================================
// Fill Notifications
// =============================================================================

struct FillRecord {
    PoolKey key;
    int32_t tick;
    bool zero_for_one;
    U128 input;             // bucket volume sold into the pool
    U128 output;            // proceeds credited to claim holders
    OrderId order_id;
};

// Called as each bucket fills. A fill only becomes final when the trade that
// triggered it commits.
class FillListener {
public:
    virtual ~FillListener() = default;
    virtual void on_order_filled(const FillRecord& fill) = 0;
};

// =============================================================================
// LimitOrderHook - take-profit orders executed as the pool price crosses them
// =============================================================================
//
// Orders rest in (pool, usable tick, direction) buckets. Depositors receive
// claim units 1:1 with the input they deposit; after a fill each unit redeems
// a pro-rata share of the bucket's output.
//
// A zero_for_one order sells currency0 once the price has risen to its tick;
// a one_for_zero order sells currency1 once the price has fallen to it.

class LimitOrderHook : public IHooks {
public:
    LimitOrderHook(const Address& address, Journal& journal, PoolManager& pool,
                   TokenLedger& tokens);

    HookPermissions permissions() const override;

    void after_initialize(const PoolKey& key, int32_t tick) override;
    void after_swap(const Address& sender, const PoolKey& key, const SwapParams& params,
                    const BalanceDelta& delta) override;

    // =========================================================================
    // Order Operations
    // =========================================================================

    // Deposit `amount` of the input asset at `tick`. Returns the usable tick
    // the order rests at.
    int32_t place_order(const Address& caller, const PoolKey& key, int32_t tick,
                        bool zero_for_one, U128 amount);

    // Withdraw `amount` of still-pending input, burning the same number of claims
    void cancel_order(const Address& caller, const PoolKey& key, int32_t tick,
                      bool zero_for_one, U128 amount);

    // Burn `amount` claims for their share of filled output. Returns the share.
    U128 redeem(const Address& caller, const PoolKey& key, int32_t tick,
                bool zero_for_one, U128 amount);

    // =========================================================================
    // Query Operations
    // =========================================================================

    U128 pending_orders(const PoolKey& key, int32_t tick, bool zero_for_one) const;
    U128 claim_supply(const OrderId& id) const;
    U128 claimable_output(const OrderId& id) const;
    U128 claim_balance(const Address& holder, const OrderId& id) const;
    std::optional<int32_t> last_tick(const PoolKey& key) const;
    size_t nonzero_buckets(const PoolKey& key) const;

    static OrderId order_id(const PoolKey& key, int32_t tick, bool zero_for_one) {
        return derive_order_id(key, tick, zero_for_one);
    }

    const Address& address() const { return address_; }

    void set_listener(FillListener* listener) { listener_ = listener; }

    const OrderLedgerStats& get_stats() const { return ledger_.stats(); }

private:
    // Marks a pool as being scanned for the guard's lifetime
    class ScanGuard {
    public:
        ScanGuard(std::unordered_set<uint64_t>& scanning, uint64_t pool_id)
            : scanning_(scanning), pool_id_(pool_id) {
            scanning_.insert(pool_id_);
        }
        ~ScanGuard() { scanning_.erase(pool_id_); }

        ScanGuard(const ScanGuard&) = delete;
        ScanGuard& operator=(const ScanGuard&) = delete;

    private:
        std::unordered_set<uint64_t>& scanning_;
        uint64_t pool_id_;
    };

    void execute_crossed(const PoolKey& key);
    void fill(const PoolKey& key, int32_t tick, bool zero_for_one);

    static int32_t usable_tick(const PoolKey& key, int32_t tick);
    static const Currency& input_currency(const PoolKey& key, bool zero_for_one) {
        return zero_for_one ? key.currency0 : key.currency1;
    }
    static const Currency& output_currency(const PoolKey& key, bool zero_for_one) {
        return zero_for_one ? key.currency1 : key.currency0;
    }

    Address address_;
    Journal& journal_;
    PoolManager& pool_;
    OrderLedger ledger_;
    ClaimLedger claims_;
    Settlement settlement_;
    FillListener* listener_{nullptr};
    std::unordered_set<uint64_t> scanning_;
};

} // namespace tickbook

#endif // TICKBOOK_HOOK_HPP
