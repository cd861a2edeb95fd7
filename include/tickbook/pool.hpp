#ifndef TICKBOOK_POOL_HPP
#define TICKBOOK_POOL_HPP

#include <map>
#include <unordered_map>
#include <optional>
#include <functional>
#include <utility>

#include "types.hpp"
#include "journal.hpp"
#include "token.hpp"

namespace tickbook {

// =============================================================================
// Pool Slot0 State
// =============================================================================

struct Slot0 {
    int32_t tick;           // Current tick
    uint32_t lp_fee;        // LP fee (hundredths of bip)
};

// =============================================================================
// Position Info
// =============================================================================

struct PositionInfo {
    U128 liquidity;         // Full-range liquidity shares
};

// =============================================================================
// Pool State (single pool)
// =============================================================================

// Full-range constant-product pool; reserve1 / reserve0 is the price of
// currency0 in units of currency1.
struct PoolState {
    PoolKey key;
    Slot0 slot0;
    U128 reserve0;
    U128 reserve1;
    U128 liquidity;              // Total outstanding shares
    std::map<std::pair<Address, uint64_t>, PositionInfo> positions;  // (owner, salt)
};

struct PoolManagerState {
    std::unordered_map<uint64_t, PoolState> pools;
    std::map<std::pair<Address, Currency>, I128> currency_deltas;  // (account, currency)
    std::map<Currency, U128> synced;                               // reserves snapshot for settle()
    uint64_t total_swaps{0};
    uint64_t total_liquidity_ops{0};
};

// =============================================================================
// Hook Interface
// =============================================================================

// Callbacks a hook wants dispatched. Everything not listed as enabled is
// never called.
struct HookPermissions {
    bool before_initialize{false};
    bool after_initialize{false};
    bool before_modify_liquidity{false};
    bool after_modify_liquidity{false};
    bool before_swap{false};
    bool after_swap{false};
};

class IHooks {
public:
    virtual ~IHooks() = default;

    // Read once, at registration time
    virtual HookPermissions permissions() const = 0;

    virtual bool before_initialize(const PoolKey& key, int32_t tick) { return true; }
    virtual void after_initialize(const PoolKey& key, int32_t tick) {}

    virtual bool before_modify_liquidity(const Address& sender, const PoolKey& key,
                                         const ModifyLiquidityParams& params) { return true; }
    virtual void after_modify_liquidity(const Address& sender, const PoolKey& key,
                                        const ModifyLiquidityParams& params,
                                        const BalanceDelta& delta) {}

    virtual bool before_swap(const Address& sender, const PoolKey& key,
                             const SwapParams& params) { return true; }
    virtual void after_swap(const Address& sender, const PoolKey& key,
                            const SwapParams& params, const BalanceDelta& delta) {}
};

// =============================================================================
// PoolManager - singleton AMM pool manager with flash accounting
// =============================================================================
//
// Holds every pool's reserves under its own address in the TokenLedger.
// swap() and modify_liquidity() record per-(account, currency) deltas that the
// caller must clear with take()/sync()/settle() before the outermost lock()
// returns. lock() is a Transaction: any error inside it restores every
// revertible store attached to the journal.

class PoolManager : public Versioned<PoolManagerState> {
public:
    PoolManager(const Address& address, Journal& journal, TokenLedger& tokens);

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Initialize a new pool at the given tick. Returns the tick.
    int32_t initialize(const PoolKey& key, int32_t tick);

    // Returns the balance delta accrued to `sender` (positive = owed to pool)
    BalanceDelta swap(const Address& sender, const PoolKey& key, const SwapParams& params);

    BalanceDelta modify_liquidity(const Address& sender, const PoolKey& key,
                                  const ModifyLiquidityParams& params);

    // =========================================================================
    // Flash Accounting
    // =========================================================================

    using LockCallback = std::function<void()>;
    void lock(const LockCallback& callback);

    bool is_locked() const { return locked_; }

    // Send `amount` of currency out of the pool; adds to the account's debt
    void take(const Address& account, const Currency& currency, const Address& to, U128 amount);

    // Snapshot the manager's balance of currency ahead of a payment
    void sync(const Currency& currency);

    // Credit the account with everything paid in since sync(); returns the amount
    U128 settle(const Address& account, const Currency& currency);

    I128 currency_delta(const Address& account, const Currency& currency) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Slot0> get_slot0(const PoolKey& key) const;
    std::optional<std::pair<U128, U128>> get_reserves(const PoolKey& key) const;
    std::optional<U128> get_liquidity(const PoolKey& key) const;
    std::optional<PositionInfo> get_position(const PoolKey& key, const Address& owner,
                                             uint64_t salt = 0) const;

    bool pool_exists(const PoolKey& key) const;

    const Address& address() const { return address_; }

    // =========================================================================
    // Hook Registration
    // =========================================================================

    void register_hooks(const Address& hook_addr, IHooks* hooks);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    struct HookEntry {
        IHooks* hooks;
        HookPermissions permissions;
    };

    Address address_;
    TokenLedger& tokens_;
    std::map<Address, HookEntry> hooks_;
    bool locked_{false};

    PoolState& require_pool(const PoolKey& key);
    const PoolState* get_pool(const PoolKey& key) const;
    const HookEntry* get_hooks(const PoolKey& key) const;
    void require_locked(const char* op) const;

    void account_delta(const Address& account, const PoolKey& key, const BalanceDelta& delta);
    U128 balance_of(const Currency& currency) const;

    // Swap computation
    struct SwapResult {
        U128 amount_in;
        U128 amount_out;
    };
    static SwapResult compute_swap(const PoolState& pool, bool zero_for_one,
                                   I128 amount_specified);
};

} // namespace tickbook

#endif // TICKBOOK_POOL_HPP
