#ifndef TICKBOOK_CONFIG_HPP
#define TICKBOOK_CONFIG_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace tickbook {

// =============================================================================
// Simulator Configuration (JSON)
// =============================================================================
//
// {
//   "general":  { "log_level": "info" },
//   "tokens":   [ { "name": "USDC", "id": 4096 } ],
//   "accounts": [ { "name": "alice", "id": 1, "balances": { "USDC": "1000" } } ],
//   "pools":    [ { "name": "eth-usdc", "currency0": "native", "currency1": "USDC",
//                   "fee": 3000, "tick_spacing": 60, "initial_tick": 0,
//                   "provider": "alice", "liquidity": "100" } ],
//   "steps":    [ { "action": "place", "account": "alice", "pool": "eth-usdc",
//                   "tick": 120, "zero_for_one": true, "amount": "1.5" } ]
// }
//
// Amounts are decimal strings with up to 18 decimals. The token name "native"
// always denotes the chain-native currency.

struct GeneralConfig {
    std::string log_level = "info";
};

struct TokenConfig {
    std::string name;
    uint64_t id = 0;
};

struct AccountConfig {
    std::string name;
    uint64_t id = 0;
    std::map<std::string, U128> balances;     // token name -> amount
};

struct PoolConfig {
    std::string name;
    std::string currency0;
    std::string currency1;
    uint32_t fee = fees::FEE_030;
    int32_t tick_spacing = 60;
    int32_t initial_tick = 0;
    std::string provider;                     // account seeding liquidity
    U128 liquidity = 0;
};

struct StepConfig {
    std::string action;                       // place | cancel | redeem | swap
    std::string account;
    std::string pool;
    int32_t tick = 0;
    bool zero_for_one = true;
    U128 amount = 0;
};

class Config {
public:
    GeneralConfig general;
    std::vector<TokenConfig> tokens;
    std::vector<AccountConfig> accounts;
    std::vector<PoolConfig> pools;
    std::vector<StepConfig> steps;

    Config() = default;

    // Load from JSON file. Throws Error(INVALID_CONFIG).
    static Config from_file(std::string_view path);

    // Load from JSON string. Throws Error(INVALID_CONFIG).
    static Config from_json(std::string_view content);

    const TokenConfig* find_token(std::string_view name) const;
    const AccountConfig* find_account(std::string_view name) const;
    const PoolConfig* find_pool(std::string_view name) const;

    // Resolve a token name to its currency ("native" -> zero address)
    Currency currency(std::string_view name) const;

private:
    void validate() const;
};

} // namespace tickbook

#endif // TICKBOOK_CONFIG_HPP
