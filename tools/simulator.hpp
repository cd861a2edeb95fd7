#ifndef TICKBOOK_TOOLS_SIMULATOR_HPP
#define TICKBOOK_TOOLS_SIMULATOR_HPP

#include "tickbook/tickbook.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <tuple>
#include <unordered_map>

namespace tickbook {
namespace sim {

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Logging
//------------------------------------------------------------------------------

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

Level parse_level(const std::string& name);

// Leveled lines on stderr: "[info] message"
class Log {
public:
    explicit Log(Level min) : min_(min) {}

    void debug(const std::string& msg) const { write(Level::Debug, "debug", msg); }
    void info(const std::string& msg) const { write(Level::Info, "info", msg); }
    void warn(const std::string& msg) const { write(Level::Warn, "warn", msg); }
    void error(const std::string& msg) const { write(Level::Error, "error", msg); }

private:
    void write(Level level, const char* tag, const std::string& msg) const;

    Level min_;
};

//------------------------------------------------------------------------------
// Simulator
//------------------------------------------------------------------------------
//
// Owns a complete market (ledger, pool manager, hook, router) built from a
// Config. Steps run one at a time; a failed step is reported and the run
// continues. Fill records from a step are kept only if the step succeeds.

class Simulator : public FillListener {
public:
    Simulator(const Config& config, const Log& log);
    ~Simulator() override;

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    // Mints balances, approves the router and hook, opens and seeds pools
    void setup();

    // One result object per step: index, action, account, ok, result or error
    json run_steps();

    json summary(json steps) const;

    void on_order_filled(const FillRecord& fill) override;

private:
    using BucketRef = std::tuple<std::string, int32_t, bool>;  // (pool name, tick, direction)

    PoolKey key_for(const PoolConfig& pool) const;
    json run_step(const StepConfig& step);

    const Config& config_;
    const Log& log_;

    Journal journal_;
    TokenLedger tokens_;
    PoolManager manager_;
    LimitOrderHook hook_;
    PoolRouter router_;

    std::unordered_map<uint64_t, std::string> pool_names_;
    std::set<BucketRef> touched_;
    json fills_ = json::array();

    // Tentative until the current step commits
    json pending_fills_ = json::array();
    std::set<BucketRef> pending_touched_;
};

} // namespace sim
} // namespace tickbook

#endif // TICKBOOK_TOOLS_SIMULATOR_HPP
