// =============================================================================
// config.cpp - Simulator configuration loader (nlohmann::json)
// =============================================================================

#include "tickbook/config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

namespace tickbook {

using json = nlohmann::json;

namespace {

constexpr const char* NATIVE_NAME = "native";

// Amounts are decimal strings ("1.5") or whole numbers of units
U128 parse_amount(const json& value, const std::string& field) {
    if (value.is_string()) {
        try {
            return x18::parse(value.get<std::string>());
        } catch (const Error& e) {
            throw Error(errors::INVALID_CONFIG, field + ": " + e.what());
        }
    }
    if (value.is_number_unsigned()) {
        return x18::from_int(value.get<uint64_t>());
    }
    throw Error(errors::INVALID_CONFIG, field + ": amount must be a decimal string");
}

TokenConfig parse_token(const json& j) {
    TokenConfig token;
    token.name = j.at("name").get<std::string>();
    token.id = j.at("id").get<uint64_t>();
    return token;
}

AccountConfig parse_account(const json& j) {
    AccountConfig account;
    account.name = j.at("name").get<std::string>();
    account.id = j.at("id").get<uint64_t>();
    if (j.contains("balances")) {
        const json& balances = j.at("balances");
        for (auto it = balances.begin(); it != balances.end(); ++it) {
            account.balances[it.key()] =
                parse_amount(it.value(), "accounts." + account.name + ".balances." + it.key());
        }
    }
    return account;
}

PoolConfig parse_pool(const json& j) {
    PoolConfig pool;
    pool.name = j.at("name").get<std::string>();
    pool.currency0 = j.at("currency0").get<std::string>();
    pool.currency1 = j.at("currency1").get<std::string>();
    pool.fee = j.value("fee", pool.fee);
    pool.tick_spacing = j.value("tick_spacing", pool.tick_spacing);
    pool.initial_tick = j.value("initial_tick", pool.initial_tick);
    pool.provider = j.value("provider", std::string{});
    if (j.contains("liquidity")) {
        pool.liquidity = parse_amount(j.at("liquidity"), "pools." + pool.name + ".liquidity");
    }
    return pool;
}

StepConfig parse_step(const json& j, size_t index) {
    StepConfig step;
    step.action = j.at("action").get<std::string>();
    step.account = j.at("account").get<std::string>();
    step.pool = j.at("pool").get<std::string>();
    step.tick = j.value("tick", step.tick);
    step.zero_for_one = j.value("zero_for_one", step.zero_for_one);
    if (j.contains("amount")) {
        step.amount = parse_amount(j.at("amount"), "steps[" + std::to_string(index) + "].amount");
    }
    return step;
}

template <typename T>
void require_unique_names(const std::vector<T>& items, const char* section) {
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (item.name.empty()) {
            throw Error(errors::INVALID_CONFIG, std::string(section) + ": empty name");
        }
        if (!seen.insert(item.name).second) {
            throw Error(errors::INVALID_CONFIG,
                        std::string(section) + ": duplicate name '" + item.name + "'");
        }
    }
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw Error(errors::INVALID_CONFIG, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        json doc = json::parse(content.begin(), content.end());
        if (!doc.is_object()) {
            throw Error(errors::INVALID_CONFIG, "top level must be an object");
        }

        if (doc.contains("general")) {
            config.general.log_level = doc.at("general").value("log_level", config.general.log_level);
        }
        if (doc.contains("tokens")) {
            for (const auto& t : doc.at("tokens")) config.tokens.push_back(parse_token(t));
        }
        if (doc.contains("accounts")) {
            for (const auto& a : doc.at("accounts")) config.accounts.push_back(parse_account(a));
        }
        if (doc.contains("pools")) {
            for (const auto& p : doc.at("pools")) config.pools.push_back(parse_pool(p));
        }
        if (doc.contains("steps")) {
            size_t index = 0;
            for (const auto& s : doc.at("steps")) config.steps.push_back(parse_step(s, index++));
        }
    } catch (const json::exception& e) {
        throw Error(errors::INVALID_CONFIG, e.what());
    }

    config.validate();
    return config;
}

// =============================================================================
// Validation
// =============================================================================

void Config::validate() const {
    static const std::set<std::string> levels = {"debug", "info", "warn", "error"};
    if (levels.count(general.log_level) == 0) {
        throw Error(errors::INVALID_CONFIG, "unknown log_level '" + general.log_level + "'");
    }

    require_unique_names(tokens, "tokens");
    require_unique_names(accounts, "accounts");
    require_unique_names(pools, "pools");

    std::set<uint64_t> ids;
    for (const auto& token : tokens) {
        if (token.name == NATIVE_NAME) {
            throw Error(errors::INVALID_CONFIG, "token name 'native' is reserved");
        }
        if (token.id == 0 || !ids.insert(token.id).second) {
            throw Error(errors::INVALID_CONFIG, "token '" + token.name + "' needs a unique nonzero id");
        }
    }
    for (const auto& account : accounts) {
        if (account.id == 0 || !ids.insert(account.id).second) {
            throw Error(errors::INVALID_CONFIG,
                        "account '" + account.name + "' needs a unique nonzero id");
        }
        for (const auto& entry : account.balances) {
            currency(entry.first);
        }
    }

    for (const auto& pool : pools) {
        if (!(currency(pool.currency0) < currency(pool.currency1))) {
            throw Error(errors::INVALID_CONFIG,
                        "pool '" + pool.name + "': currency0 must sort below currency1");
        }
        if (pool.liquidity != 0 && !find_account(pool.provider)) {
            throw Error(errors::INVALID_CONFIG,
                        "pool '" + pool.name + "': unknown provider '" + pool.provider + "'");
        }
    }

    static const std::set<std::string> actions = {"place", "cancel", "redeem", "swap"};
    for (size_t i = 0; i < steps.size(); ++i) {
        const StepConfig& step = steps[i];
        std::string where = "steps[" + std::to_string(i) + "]";
        if (actions.count(step.action) == 0) {
            throw Error(errors::INVALID_CONFIG, where + ": unknown action '" + step.action + "'");
        }
        if (!find_account(step.account)) {
            throw Error(errors::INVALID_CONFIG, where + ": unknown account '" + step.account + "'");
        }
        if (!find_pool(step.pool)) {
            throw Error(errors::INVALID_CONFIG, where + ": unknown pool '" + step.pool + "'");
        }
    }
}

// =============================================================================
// Lookup
// =============================================================================

const TokenConfig* Config::find_token(std::string_view name) const {
    for (const auto& token : tokens) {
        if (token.name == name) return &token;
    }
    return nullptr;
}

const AccountConfig* Config::find_account(std::string_view name) const {
    for (const auto& account : accounts) {
        if (account.name == name) return &account;
    }
    return nullptr;
}

const PoolConfig* Config::find_pool(std::string_view name) const {
    for (const auto& pool : pools) {
        if (pool.name == name) return &pool;
    }
    return nullptr;
}

Currency Config::currency(std::string_view name) const {
    if (name == NATIVE_NAME) return NATIVE;

    const TokenConfig* token = find_token(name);
    if (!token) {
        throw Error(errors::INVALID_CONFIG, "unknown token '" + std::string(name) + "'");
    }
    return Currency(addresses::from_id(token->id));
}

} // namespace tickbook
