// Scenario simulator: builds a market from a Config and runs its steps

#include "simulator.hpp"

#include <iostream>

namespace tickbook {
namespace sim {

//------------------------------------------------------------------------------
// Logging
//------------------------------------------------------------------------------

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

void Log::write(Level level, const char* tag, const std::string& msg) const {
    if (level < min_) return;
    std::cerr << "[" << tag << "] " << msg << "\n";
}

//------------------------------------------------------------------------------
// Simulator
//------------------------------------------------------------------------------

Simulator::Simulator(const Config& config, const Log& log)
    : config_(config),
      log_(log),
      tokens_(journal_),
      manager_(addresses::POOL_MANAGER, journal_, tokens_),
      hook_(addresses::LIMIT_HOOK, journal_, manager_, tokens_),
      router_(addresses::ROUTER, manager_, tokens_) {
    manager_.register_hooks(hook_.address(), &hook_);
    hook_.set_listener(this);
}

Simulator::~Simulator() { hook_.set_listener(nullptr); }

void Simulator::setup() {
    for (const auto& account : config_.accounts) {
        Address addr = addresses::from_id(account.id);
        for (const auto& [token, amount] : account.balances) {
            Currency currency = config_.currency(token);
            if (currency.is_native()) {
                tokens_.mint_native(addr, amount);
            } else {
                tokens_.mint(currency, addr, amount);
            }
            log_.debug("minted " + x18::format(amount) + " " + token + " to " + account.name);
        }
        // Unlimited allowances for the router and the hook
        for (const auto& token : config_.tokens) {
            Currency currency(addresses::from_id(token.id));
            tokens_.approve(currency, addr, router_.address(), U128_MAX);
            tokens_.approve(currency, addr, hook_.address(), U128_MAX);
        }
    }

    for (const auto& pool : config_.pools) {
        PoolKey key = key_for(pool);
        manager_.initialize(key, pool.initial_tick);
        pool_names_[key.id()] = pool.name;
        log_.info("initialized pool " + pool.name + " at tick " +
                  std::to_string(pool.initial_tick));

        if (pool.liquidity != 0) {
            Address provider = addresses::from_id(config_.find_account(pool.provider)->id);
            router_.modify_liquidity(provider, key,
                                     ModifyLiquidityParams{static_cast<I128>(pool.liquidity), 0});
            log_.info("seeded " + pool.name + " with " + x18::format(pool.liquidity) +
                      " liquidity from " + pool.provider);
        }
    }
}

json Simulator::run_steps() {
    json results = json::array();

    for (size_t i = 0; i < config_.steps.size(); ++i) {
        const StepConfig& step = config_.steps[i];
        json result = {{"index", i}, {"action", step.action}, {"account", step.account}};

        try {
            result["result"] = run_step(step);
            result["ok"] = true;
        } catch (const Error& e) {
            log_.warn("step " + std::to_string(i) + " (" + step.action + ") failed: " + e.what());
            result["ok"] = false;
            result["error"] = errors::name(e.code());
            result["message"] = e.what();
        }
        results.push_back(result);
    }
    return results;
}

json Simulator::summary(json steps) const {
    json out;
    out["steps"] = std::move(steps);
    out["fills"] = fills_;

    json orders = json::array();
    for (const auto& [pool_name, tick, zero_for_one] : touched_) {
        PoolKey key = key_for(*config_.find_pool(pool_name));
        OrderId id = LimitOrderHook::order_id(key, tick, zero_for_one);
        orders.push_back({
            {"pool", pool_name},
            {"tick", tick},
            {"zero_for_one", zero_for_one},
            {"order_id", id.to_hex()},
            {"pending", x18::format(hook_.pending_orders(key, tick, zero_for_one))},
            {"claim_supply", x18::format(hook_.claim_supply(id))},
            {"claimable_output", x18::format(hook_.claimable_output(id))}
        });
    }
    out["orders"] = orders;

    json pools = json::array();
    for (const auto& pool : config_.pools) {
        PoolKey key = key_for(pool);
        auto slot0 = manager_.get_slot0(key);
        auto reserves = manager_.get_reserves(key);
        auto last = hook_.last_tick(key);
        pools.push_back({
            {"name", pool.name},
            {"tick", slot0 ? slot0->tick : 0},
            {"last_tick", last ? json(*last) : json(nullptr)},
            {"reserve0", reserves ? x18::format(reserves->first) : "0"},
            {"reserve1", reserves ? x18::format(reserves->second) : "0"}
        });
    }
    out["pools"] = pools;

    json accounts = json::array();
    for (const auto& account : config_.accounts) {
        Address addr = addresses::from_id(account.id);
        json balances;
        balances["native"] = x18::format(tokens_.native_balance(addr));
        for (const auto& token : config_.tokens) {
            Currency currency(addresses::from_id(token.id));
            balances[token.name] = x18::format(tokens_.balance_of(currency, addr));
        }
        accounts.push_back({{"name", account.name}, {"balances", balances}});
    }
    out["accounts"] = accounts;

    const OrderLedgerStats& stats = hook_.get_stats();
    out["stats"] = {
        {"orders_placed", stats.orders_placed},
        {"cancellations", stats.cancellations},
        {"redemptions", stats.redemptions},
        {"fills", stats.fills},
        {"filled_volume", x18::format(stats.filled_volume)}
    };
    return out;
}

void Simulator::on_order_filled(const FillRecord& fill) {
    auto it = pool_names_.find(fill.key.id());
    std::string pool = it != pool_names_.end() ? it->second : std::to_string(fill.key.id());
    log_.info("filled " + pool + " tick " + std::to_string(fill.tick) +
              (fill.zero_for_one ? " sell0 " : " sell1 ") + x18::format(fill.input) +
              " -> " + x18::format(fill.output));
    pending_fills_.push_back({
        {"pool", pool},
        {"tick", fill.tick},
        {"zero_for_one", fill.zero_for_one},
        {"input", x18::format(fill.input)},
        {"output", x18::format(fill.output)},
        {"order_id", fill.order_id.to_hex()}
    });
    pending_touched_.insert({pool, fill.tick, fill.zero_for_one});
}

PoolKey Simulator::key_for(const PoolConfig& pool) const {
    return PoolKey{config_.currency(pool.currency0), config_.currency(pool.currency1),
                   pool.fee, pool.tick_spacing, hook_.address()};
}

json Simulator::run_step(const StepConfig& step) {
    const PoolConfig& pool = *config_.find_pool(step.pool);
    PoolKey key = key_for(pool);
    Address account = addresses::from_id(config_.find_account(step.account)->id);

    pending_fills_ = json::array();
    pending_touched_.clear();
    json result;

    if (step.action == "place") {
        int32_t tick = hook_.place_order(account, key, step.tick, step.zero_for_one, step.amount);
        pending_touched_.insert({pool.name, tick, step.zero_for_one});
        log_.info(step.account + " placed " + x18::format(step.amount) + " at tick " +
                  std::to_string(tick) + " on " + pool.name);
        result = {{"tick", tick}};
    } else if (step.action == "cancel") {
        hook_.cancel_order(account, key, step.tick, step.zero_for_one, step.amount);
        log_.info(step.account + " cancelled " + x18::format(step.amount) + " on " + pool.name);
        result = {{"cancelled", x18::format(step.amount)}};
    } else if (step.action == "redeem") {
        U128 out = hook_.redeem(account, key, step.tick, step.zero_for_one, step.amount);
        log_.info(step.account + " redeemed " + x18::format(step.amount) + " claims for " +
                  x18::format(out));
        result = {{"output", x18::format(out)}};
    } else {
        if (step.amount > (U128_MAX >> 1)) {
            throw Error(errors::MATH_OVERFLOW, "swap amount out of range");
        }
        SwapParams params{step.zero_for_one, static_cast<I128>(step.amount),
                          tick_math::extreme_limit(step.zero_for_one)};
        BalanceDelta delta = router_.swap(account, key, params);
        int32_t tick = manager_.get_slot0(key)->tick;
        log_.info(step.account + " swapped on " + pool.name + ", tick now " +
                  std::to_string(tick));
        result = {{"amount0", to_string(delta.amount0)},
                  {"amount1", to_string(delta.amount1)},
                  {"tick", tick}};
    }

    for (auto& fill : pending_fills_) fills_.push_back(fill);
    touched_.insert(pending_touched_.begin(), pending_touched_.end());
    return result;
}

} // namespace sim
} // namespace tickbook
