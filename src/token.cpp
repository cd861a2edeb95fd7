// =============================================================================
// token.cpp - TokenLedger Implementation
// =============================================================================

#include "tickbook/token.hpp"

namespace tickbook {

TokenLedger::TokenLedger(Journal& journal) : Versioned(journal) {}

void TokenLedger::require_token(const Currency& token) {
    if (token.is_native()) {
        throw Error(errors::INVALID_CURRENCY, "native currency has no token contract");
    }
}

// =============================================================================
// Issuance
// =============================================================================

void TokenLedger::mint(const Currency& token, const Address& to, U128 amount) {
    require_token(token);
    U128& balance = state_.balances[{token, to}];
    if (balance > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "token balance overflow");
    }
    balance += amount;
}

void TokenLedger::mint_native(const Address& to, U128 amount) {
    U128& balance = state_.native[to];
    if (balance > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "native balance overflow");
    }
    balance += amount;
}

// =============================================================================
// Token Operations
// =============================================================================

void TokenLedger::transfer(const Currency& token, const Address& from,
                           const Address& to, U128 amount) {
    require_token(token);

    auto it = state_.balances.find({token, from});
    if (it == state_.balances.end() || it->second < amount) {
        throw Error(errors::INSUFFICIENT_BALANCE,
                    "transfer of " + to_string(amount) + " from " + addresses::to_hex(from));
    }
    if (from == to) return;

    U128& dest = state_.balances[{token, to}];
    if (dest > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "token balance overflow");
    }
    it->second -= amount;
    dest += amount;
}

void TokenLedger::approve(const Currency& token, const Address& owner,
                          const Address& spender, U128 amount) {
    require_token(token);
    state_.allowances[{token, owner, spender}] = amount;
}

void TokenLedger::transfer_from(const Currency& token, const Address& spender,
                                const Address& from, const Address& to, U128 amount) {
    require_token(token);

    auto it = state_.allowances.find({token, from, spender});
    if (it == state_.allowances.end() || it->second < amount) {
        throw Error(errors::INSUFFICIENT_ALLOWANCE,
                    addresses::to_hex(spender) + " may not move " + to_string(amount) +
                    " from " + addresses::to_hex(from));
    }
    transfer(token, from, to, amount);
    if (it->second != U128_MAX) {
        it->second -= amount;
    }
}

U128 TokenLedger::balance_of(const Currency& token, const Address& holder) const {
    auto it = state_.balances.find({token, holder});
    return it != state_.balances.end() ? it->second : 0;
}

U128 TokenLedger::allowance(const Currency& token, const Address& owner,
                            const Address& spender) const {
    auto it = state_.allowances.find({token, owner, spender});
    return it != state_.allowances.end() ? it->second : 0;
}

// =============================================================================
// Native Asset
// =============================================================================

void TokenLedger::send_value(const Address& from, const Address& to, U128 amount) {
    auto it = state_.native.find(from);
    if (it == state_.native.end() || it->second < amount) {
        throw Error(errors::INSUFFICIENT_BALANCE,
                    "value transfer of " + to_string(amount) + " from " + addresses::to_hex(from));
    }
    if (from == to) return;

    U128& dest = state_.native[to];
    if (dest > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "native balance overflow");
    }
    it->second -= amount;
    dest += amount;
}

U128 TokenLedger::native_balance(const Address& holder) const {
    auto it = state_.native.find(holder);
    return it != state_.native.end() ? it->second : 0;
}

} // namespace tickbook
