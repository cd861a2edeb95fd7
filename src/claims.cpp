// =============================================================================
// claims.cpp - ClaimLedger Implementation
// =============================================================================

#include "tickbook/claims.hpp"

namespace tickbook {

ClaimLedger::ClaimLedger(Journal& journal, const Address& minter)
    : Versioned(journal), minter_(minter) {}

void ClaimLedger::require_minter(const Address& caller) const {
    if (caller != minter_) {
        throw Error(errors::UNAUTHORIZED,
                    addresses::to_hex(caller) + " is not the claim minter");
    }
}

void ClaimLedger::mint(const Address& caller, const Address& to, const OrderId& id, U128 amount) {
    require_minter(caller);

    U128& supply = state_.supply[id];
    if (supply > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "claim supply overflow for " + id.to_hex());
    }
    supply += amount;
    state_.balances[{to, id}] += amount;
}

void ClaimLedger::burn(const Address& caller, const Address& from, const OrderId& id, U128 amount) {
    require_minter(caller);

    auto it = state_.balances.find({from, id});
    if (it == state_.balances.end() || it->second < amount) {
        throw Error(errors::INSUFFICIENT_BALANCE,
                    "burn of " + to_string(amount) + " claims from " + addresses::to_hex(from));
    }
    it->second -= amount;
    state_.supply[id] -= amount;
}

U128 ClaimLedger::balance_of(const Address& holder, const OrderId& id) const {
    auto it = state_.balances.find({holder, id});
    return it != state_.balances.end() ? it->second : 0;
}

U128 ClaimLedger::total_supply(const OrderId& id) const {
    auto it = state_.supply.find(id);
    return it != state_.supply.end() ? it->second : 0;
}

} // namespace tickbook
