#ifndef TICKBOOK_CLAIMS_HPP
#define TICKBOOK_CLAIMS_HPP

#include <map>
#include <utility>

#include "types.hpp"
#include "journal.hpp"
#include "order_id.hpp"

namespace tickbook {

struct ClaimLedgerState {
    std::map<std::pair<Address, OrderId>, U128> balances;  // (holder, order) -> units
    std::map<OrderId, U128> supply;
};

// =============================================================================
// ClaimLedger - multi-token claim units, one token id per order
// =============================================================================
//
// Only the minter may mint or burn. The ledger keeps no accounting of its own
// beyond balances; the order ledger drives every change.

class ClaimLedger : public Versioned<ClaimLedgerState> {
public:
    ClaimLedger(Journal& journal, const Address& minter);

    void mint(const Address& caller, const Address& to, const OrderId& id, U128 amount);
    void burn(const Address& caller, const Address& from, const OrderId& id, U128 amount);

    U128 balance_of(const Address& holder, const OrderId& id) const;
    U128 total_supply(const OrderId& id) const;

    const Address& minter() const { return minter_; }

private:
    void require_minter(const Address& caller) const;

    Address minter_;
};

} // namespace tickbook

#endif // TICKBOOK_CLAIMS_HPP
