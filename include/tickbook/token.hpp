#ifndef TICKBOOK_TOKEN_HPP
#define TICKBOOK_TOKEN_HPP

#include <map>
#include <tuple>
#include <utility>

#include "types.hpp"
#include "journal.hpp"

namespace tickbook {

// =============================================================================
// Token Ledger State
// =============================================================================

struct TokenLedgerState {
    std::map<std::pair<Currency, Address>, U128> balances;              // (token, holder)
    std::map<std::tuple<Currency, Address, Address>, U128> allowances;  // (token, owner, spender)
    std::map<Address, U128> native;                                     // holder -> native balance
};

// =============================================================================
// TokenLedger - fungible balances for every token plus the native asset
// =============================================================================

class TokenLedger : public Versioned<TokenLedgerState> {
public:
    explicit TokenLedger(Journal& journal);

    // =========================================================================
    // Issuance (setup and faucets)
    // =========================================================================

    void mint(const Currency& token, const Address& to, U128 amount);
    void mint_native(const Address& to, U128 amount);

    // =========================================================================
    // Token Operations (ERC20-style; native currency rejected)
    // =========================================================================

    void transfer(const Currency& token, const Address& from, const Address& to, U128 amount);

    void approve(const Currency& token, const Address& owner, const Address& spender, U128 amount);

    // Moves tokens owned by `from` on behalf of `spender`; an allowance of
    // U128_MAX is treated as unlimited and never decremented.
    void transfer_from(const Currency& token, const Address& spender,
                       const Address& from, const Address& to, U128 amount);

    U128 balance_of(const Currency& token, const Address& holder) const;
    U128 allowance(const Currency& token, const Address& owner, const Address& spender) const;

    // =========================================================================
    // Native Asset (raw value transfer)
    // =========================================================================

    void send_value(const Address& from, const Address& to, U128 amount);
    U128 native_balance(const Address& holder) const;

private:
    static void require_token(const Currency& token);
};

} // namespace tickbook

#endif // TICKBOOK_TOKEN_HPP
