#ifndef TICKBOOK_ORDER_LEDGER_HPP
#define TICKBOOK_ORDER_LEDGER_HPP

#include <map>
#include <optional>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"
#include "order_id.hpp"

namespace tickbook {

// =============================================================================
// Order Book State
// =============================================================================

// Pending input volume per usable tick, one side per direction. Buckets are
// never erased; a drained bucket stays at zero.
struct PoolBook {
    std::map<int32_t, U128> sell0;         // zero_for_one = true
    std::map<int32_t, U128> sell1;         // zero_for_one = false
    std::optional<int32_t> last_tick;      // last observed usable tick
};

// Claim accounting for one order id
struct OrderInfo {
    U128 claim_supply{0};
    U128 claimable_output{0};
};

struct OrderLedgerStats {
    uint64_t orders_placed{0};
    uint64_t cancellations{0};
    uint64_t redemptions{0};
    uint64_t fills{0};
    U128 filled_volume{0};
};

struct OrderLedgerState {
    std::unordered_map<uint64_t, PoolBook> books;  // pool id -> book
    std::map<OrderId, OrderInfo> orders;
    OrderLedgerStats stats;
};

// =============================================================================
// OrderLedger - pending volume, claim accounting and last observed tick
// =============================================================================

class OrderLedger : public Versioned<OrderLedgerState> {
public:
    explicit OrderLedger(Journal& journal);

    // =========================================================================
    // Pending Volume
    // =========================================================================

    U128 pending(uint64_t pool_id, int32_t tick, bool zero_for_one) const;

    void add_pending(uint64_t pool_id, int32_t tick, bool zero_for_one, U128 amount);

    // Throws NOT_ENOUGH_TO_CLAIM if the bucket holds less than `amount`
    void remove_pending(uint64_t pool_id, int32_t tick, bool zero_for_one, U128 amount);

    // Lowest tick in [from, to] with nonzero volume when scanning upward,
    // highest when scanning downward (from > to).
    std::optional<int32_t> first_pending(uint64_t pool_id, bool zero_for_one,
                                         int32_t from, int32_t to) const;

    // Buckets of the pool holding nonzero volume, both directions
    size_t nonzero_buckets(uint64_t pool_id) const;

    // =========================================================================
    // Claim Accounting
    // =========================================================================

    OrderInfo order(const OrderId& id) const;

    void add_claim_supply(const OrderId& id, U128 amount);
    void remove_claim_supply(const OrderId& id, U128 amount);
    void add_claimable_output(const OrderId& id, U128 amount);
    void remove_claimable_output(const OrderId& id, U128 amount);

    // =========================================================================
    // Last Observed Tick
    // =========================================================================

    std::optional<int32_t> last_tick(uint64_t pool_id) const;
    void set_last_tick(uint64_t pool_id, int32_t tick);

    // =========================================================================
    // Statistics
    // =========================================================================

    const OrderLedgerStats& stats() const { return state_.stats; }
    OrderLedgerStats& stats() { return state_.stats; }

private:
    static std::map<int32_t, U128>& side(PoolBook& book, bool zero_for_one) {
        return zero_for_one ? book.sell0 : book.sell1;
    }
    static const std::map<int32_t, U128>& side(const PoolBook& book, bool zero_for_one) {
        return zero_for_one ? book.sell0 : book.sell1;
    }

    const PoolBook* find_book(uint64_t pool_id) const;
};

} // namespace tickbook

#endif // TICKBOOK_ORDER_LEDGER_HPP
