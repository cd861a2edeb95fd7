// LimitOrderHook tests: placement, cancellation, tick-crossing fills, redemption

#include "test_support.hpp"

#include <vector>

using namespace tickbook;
using namespace tickbook::test;

namespace {

struct RecordingListener : public FillListener {
    std::vector<FillRecord> fills;
    void on_order_filled(const FillRecord& fill) override { fills.push_back(fill); }
};

const U128 ORDER = E18 / 100;   // 0.01

} // namespace

TEST_CASE("Order placement", "[hook]") {
    Market m;
    PoolKey key = m.open_pool(30);

    SECTION("Deposits input and mints claims") {
        REQUIRE(m.hook.place_order(ALICE, key, 0, true, ORDER) == 0);
        OrderId id = LimitOrderHook::order_id(key, 0, true);

        REQUIRE(m.hook.pending_orders(key, 0, true) == ORDER);
        REQUIRE(m.hook.claim_supply(id) == ORDER);
        REQUIRE(m.hook.claim_balance(ALICE, id) == ORDER);
        REQUIRE(m.hook.claimable_output(id) == 0);
        REQUIRE(m.tokens.balance_of(TOKEN0, m.hook.address()) == ORDER);
        REQUIRE(m.tokens.balance_of(TOKEN0, ALICE) == 1000000 * E18 - ORDER);
        REQUIRE(m.hook.get_stats().orders_placed == 1);
    }

    SECTION("Ticks snap down to the spacing grid") {
        REQUIRE(m.hook.place_order(ALICE, key, 45, true, ORDER) == 30);
        REQUIRE(m.hook.place_order(ALICE, key, -45, false, ORDER) == -60);
        REQUIRE(m.hook.pending_orders(key, 59, true) == ORDER);
        REQUIRE(m.hook.pending_orders(key, -31, false) == ORDER);
        REQUIRE(m.tokens.balance_of(TOKEN1, m.hook.address()) == ORDER);
    }

    SECTION("Placements into one bucket share an order id") {
        m.hook.place_order(ALICE, key, 60, true, ORDER);
        m.hook.place_order(BOB, key, 75, true, 3 * ORDER);
        OrderId id = LimitOrderHook::order_id(key, 60, true);
        REQUIRE(m.hook.pending_orders(key, 60, true) == 4 * ORDER);
        REQUIRE(m.hook.claim_supply(id) == 4 * ORDER);
        REQUIRE(m.hook.claim_balance(BOB, id) == 3 * ORDER);
    }

    SECTION("Invalid placements") {
        REQUIRE_ERROR_CODE(m.hook.place_order(ALICE, key, 0, true, 0), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(m.hook.place_order(ALICE, key, tick_math::MAX_TICK + 1, true, ORDER),
                           errors::INVALID_TICK);
        PoolKey bad = key;
        bad.tick_spacing = 0;
        REQUIRE_ERROR_CODE(m.hook.place_order(ALICE, bad, 0, true, ORDER), errors::INVALID_TICK);
    }

    SECTION("Failed deposit leaves no trace") {
        m.tokens.approve(TOKEN0, ALICE, m.hook.address(), ORDER - 1);
        REQUIRE_ERROR_CODE(m.hook.place_order(ALICE, key, 0, true, ORDER),
                           errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(m.hook.pending_orders(key, 0, true) == 0);
        REQUIRE(m.hook.claim_supply(LimitOrderHook::order_id(key, 0, true)) == 0);
        REQUIRE(m.hook.get_stats().orders_placed == 0);
    }

    SECTION("Orders may rest before the pool exists") {
        PoolKey later = m.key(60);
        m.hook.place_order(ALICE, later, 120, true, ORDER);
        REQUIRE_FALSE(m.hook.last_tick(later).has_value());
        m.manager.initialize(later, 70);
        REQUIRE(m.hook.last_tick(later) == std::optional<int32_t>(60));
    }
}

TEST_CASE("Order cancellation", "[hook]") {
    Market m;
    PoolKey key = m.open_pool(30);
    OrderId id = LimitOrderHook::order_id(key, 60, true);
    m.hook.place_order(ALICE, key, 60, true, ORDER);

    SECTION("Full cancel restores the depositor exactly") {
        m.hook.cancel_order(ALICE, key, 60, true, ORDER);
        REQUIRE(m.tokens.balance_of(TOKEN0, ALICE) == 1000000 * E18);
        REQUIRE(m.hook.pending_orders(key, 60, true) == 0);
        REQUIRE(m.hook.claim_supply(id) == 0);
        REQUIRE(m.hook.claim_balance(ALICE, id) == 0);
        REQUIRE(m.hook.get_stats().cancellations == 1);
    }

    SECTION("Partial cancel") {
        m.hook.cancel_order(ALICE, key, 60, true, ORDER / 4);
        REQUIRE(m.hook.pending_orders(key, 60, true) == ORDER - ORDER / 4);
        REQUIRE(m.hook.claim_balance(ALICE, id) == ORDER - ORDER / 4);
    }

    SECTION("Claim checks") {
        REQUIRE_ERROR_CODE(m.hook.cancel_order(BOB, key, 60, true, 1), errors::NOTHING_TO_CLAIM);
        REQUIRE_ERROR_CODE(m.hook.cancel_order(ALICE, key, 60, true, ORDER + 1),
                           errors::NOT_ENOUGH_TO_CLAIM);
        REQUIRE_ERROR_CODE(m.hook.cancel_order(ALICE, key, 60, true, 0), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(m.hook.cancel_order(ALICE, key, 60, false, 1), errors::NOTHING_TO_CLAIM);
    }
}

TEST_CASE("Tick-crossing fills", "[hook]") {
    Market m;
    RecordingListener listener;
    m.hook.set_listener(&listener);

    PoolKey key = m.open_pool(30);
    REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(0));

    m.hook.place_order(ALICE, key, 0, true, ORDER);
    m.hook.place_order(BOB, key, 60, true, ORDER);
    OrderId id0 = LimitOrderHook::order_id(key, 0, true);
    OrderId id60 = LimitOrderHook::order_id(key, 60, true);

    SECTION("Trade ending between the orders fills only the lower one") {
        m.swap_exact_in(TRADER, key, false, 2250 * E18 / 1000);

        REQUIRE(m.tick(key) == 44);
        REQUIRE(m.hook.pending_orders(key, 0, true) == 0);
        REQUIRE(m.hook.claimable_output(id0) == 10014747953186665);
        REQUIRE(m.hook.pending_orders(key, 60, true) == ORDER);
        REQUIRE(m.hook.claimable_output(id60) == 0);
        REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(30));

        // Output sits in custody until redeemed
        REQUIRE(m.tokens.balance_of(TOKEN1, m.hook.address()) == 10014747953186665);
        REQUIRE(m.tokens.balance_of(TOKEN0, m.hook.address()) == ORDER);

        REQUIRE(listener.fills.size() == 1);
        REQUIRE(listener.fills[0].tick == 0);
        REQUIRE(listener.fills[0].zero_for_one);
        REQUIRE(listener.fills[0].input == ORDER);
        REQUIRE(listener.fills[0].output == 10014747953186665);
        REQUIRE(listener.fills[0].order_id == id0);
    }

    SECTION("Trade past both orders fills both in one call") {
        m.swap_exact_in(TRADER, key, false, 5 * E18);

        REQUIRE(m.tick(key) == 99);
        REQUIRE(m.hook.pending_orders(key, 0, true) == 0);
        REQUIRE(m.hook.pending_orders(key, 60, true) == 0);
        REQUIRE(m.hook.claimable_output(id0) == 10069698056891847);
        REQUIRE(m.hook.claimable_output(id60) == 10069495966634539);
        REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(90));
        REQUIRE(m.hook.nonzero_buckets(key) == 0);
        REQUIRE(m.hook.get_stats().fills == 2);
        REQUIRE(m.hook.get_stats().filled_volume == 2 * ORDER);
        REQUIRE(m.tokens.balance_of(TOKEN1, m.hook.address()) ==
                10069698056891847 + 10069495966634539);
        REQUIRE(listener.fills.size() == 2);
        REQUIRE(listener.fills[0].tick == 0);
        REQUIRE(listener.fills[1].tick == 60);
    }

    SECTION("Price moving the other way leaves sell-side orders alone") {
        m.swap_exact_in(TRADER, key, true, 2 * E18);
        REQUIRE(m.tick(key) == -40);
        REQUIRE(m.hook.pending_orders(key, 0, true) == ORDER);
        REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(-60));
        REQUIRE(listener.fills.empty());
    }

    SECTION("A trade that fails to settle reverts its fills") {
        Address poor = addresses::from_id(99);
        m.tokens.mint(TOKEN1, poor, E18);
        m.tokens.approve(TOKEN1, poor, m.router.address(), U128_MAX);

        REQUIRE_ERROR_CODE(m.swap_exact_in(poor, key, false, 5 * E18), errors::INSUFFICIENT_BALANCE);
        REQUIRE(m.tick(key) == 0);
        REQUIRE(m.hook.pending_orders(key, 0, true) == ORDER);
        REQUIRE(m.hook.pending_orders(key, 60, true) == ORDER);
        REQUIRE(m.hook.claimable_output(id0) == 0);
        REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(0));
        REQUIRE(m.tokens.balance_of(TOKEN1, m.hook.address()) == 0);
        REQUIRE(m.hook.get_stats().fills == 0);
    }

    SECTION("Filled input can no longer be cancelled") {
        m.swap_exact_in(TRADER, key, false, 2250 * E18 / 1000);
        REQUIRE_ERROR_CODE(m.hook.cancel_order(ALICE, key, 0, true, ORDER),
                           errors::NOT_ENOUGH_TO_CLAIM);
    }

    m.hook.set_listener(nullptr);
}

TEST_CASE("Downward fills", "[hook]") {
    Market m;
    PoolKey key = m.open_pool(30);
    OrderId id = LimitOrderHook::order_id(key, -60, false);

    REQUIRE(m.hook.place_order(ALICE, key, -45, false, ORDER) == -60);
    m.swap_exact_in(TRADER, key, true, 5 * E18);

    REQUIRE(m.tick(key) == -100);
    REQUIRE(m.hook.pending_orders(key, -60, false) == 0);
    REQUIRE(m.hook.claimable_output(id) == 10069698056891847);
    REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(-120));

    U128 out = m.hook.redeem(ALICE, key, -60, false, ORDER);
    REQUIRE(out == 10069698056891847);
    REQUIRE(m.tokens.balance_of(TOKEN0, ALICE) == 1000000 * E18 + out);
}

TEST_CASE("Fills that push the price back across the origin", "[hook]") {
    Market m;
    RecordingListener listener;
    m.hook.set_listener(&listener);

    PoolKey key = m.open_pool(30);
    const U128 large = 50 * E18;
    m.hook.place_order(ALICE, key, 0, true, large);
    m.hook.place_order(BOB, key, -60, false, ORDER);
    REQUIRE(m.hook.nonzero_buckets(key) == 2);

    // Lifts the price through tick 0; that fill sinks it below -60
    m.swap_exact_in(TRADER, key, false, 5 * E18);

    REQUIRE(m.tick(key) == -880);
    REQUIRE(m.hook.last_tick(key) == std::optional<int32_t>(-900));
    REQUIRE(m.hook.pending_orders(key, 0, true) == 0);
    REQUIRE(m.hook.pending_orders(key, -60, false) == 0);
    REQUIRE(m.hook.nonzero_buckets(key) == 0);
    REQUIRE(m.hook.get_stats().fills == 2);
    REQUIRE(m.hook.get_stats().filled_volume == large + ORDER);

    REQUIRE(listener.fills.size() == 2);
    REQUIRE(listener.fills[0].tick == 0);
    REQUIRE(listener.fills[0].zero_for_one);
    REQUIRE(listener.fills[0].input == large);
    REQUIRE(listener.fills[1].tick == -60);
    REQUIRE_FALSE(listener.fills[1].zero_for_one);
    REQUIRE(listener.fills[1].input == ORDER);

    REQUIRE(m.hook.claimable_output(LimitOrderHook::order_id(key, 0, true)) ==
            listener.fills[0].output);
    REQUIRE(m.hook.claimable_output(LimitOrderHook::order_id(key, -60, false)) ==
            listener.fills[1].output);

    // One trader swap plus one swap per fill, none of them rescanned
    REQUIRE(m.manager.get_stats().total_swaps == 3);

    m.hook.set_listener(nullptr);
}

TEST_CASE("Redemption", "[hook]") {
    Market m;
    PoolKey key = m.open_pool(30);
    OrderId id = LimitOrderHook::order_id(key, 0, true);

    SECTION("Nothing to redeem before a fill") {
        m.hook.place_order(ALICE, key, 0, true, ORDER);
        REQUIRE_ERROR_CODE(m.hook.redeem(ALICE, key, 0, true, ORDER), errors::NOTHING_TO_CLAIM);
    }

    SECTION("Full redemption pays the claimable output") {
        m.hook.place_order(ALICE, key, 0, true, ORDER);
        m.swap_exact_in(TRADER, key, false, 2250 * E18 / 1000);
        U128 claimable = m.hook.claimable_output(id);

        REQUIRE_ERROR_CODE(m.hook.redeem(ALICE, key, 0, true, 0), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(m.hook.redeem(BOB, key, 0, true, 1), errors::NOT_ENOUGH_TO_CLAIM);

        U128 out = m.hook.redeem(ALICE, key, 0, true, ORDER);
        REQUIRE(out == claimable);
        REQUIRE(m.tokens.balance_of(TOKEN1, ALICE) == 1000000 * E18 + claimable);
        REQUIRE(m.hook.claimable_output(id) == 0);
        REQUIRE(m.hook.claim_supply(id) == 0);
        REQUIRE(m.tokens.balance_of(TOKEN1, m.hook.address()) == 0);
        REQUIRE(m.hook.get_stats().redemptions == 1);

        REQUIRE_ERROR_CODE(m.hook.redeem(ALICE, key, 0, true, ORDER), errors::NOTHING_TO_CLAIM);
    }

    SECTION("Half holders redeem the same total in either order") {
        m.hook.place_order(ALICE, key, 0, true, ORDER / 2);
        m.hook.place_order(BOB, key, 0, true, ORDER / 2);
        m.swap_exact_in(TRADER, key, false, 2250 * E18 / 1000);
        U128 claimable = m.hook.claimable_output(id);

        U128 alice_first = m.hook.redeem(ALICE, key, 0, true, ORDER / 2);
        U128 bob_second = m.hook.redeem(BOB, key, 0, true, ORDER / 2);
        REQUIRE(alice_first + bob_second == claimable);
        REQUIRE(alice_first == claimable / 2);

        Market other;
        PoolKey other_key = other.open_pool(30);
        other.hook.place_order(ALICE, other_key, 0, true, ORDER / 2);
        other.hook.place_order(BOB, other_key, 0, true, ORDER / 2);
        other.swap_exact_in(TRADER, other_key, false, 2250 * E18 / 1000);

        U128 bob_first = other.hook.redeem(BOB, other_key, 0, true, ORDER / 2);
        U128 alice_second = other.hook.redeem(ALICE, other_key, 0, true, ORDER / 2);
        REQUIRE(bob_first + alice_second == alice_first + bob_second);
        REQUIRE(bob_first == alice_first);
    }

    SECTION("Partial redemptions") {
        m.hook.place_order(ALICE, key, 0, true, ORDER);
        m.swap_exact_in(TRADER, key, false, 2250 * E18 / 1000);
        U128 claimable = m.hook.claimable_output(id);

        U128 quarter = m.hook.redeem(ALICE, key, 0, true, ORDER / 4);
        REQUIRE(quarter == claimable / 4);
        U128 rest = m.hook.redeem(ALICE, key, 0, true, ORDER - ORDER / 4);
        REQUIRE(quarter + rest == claimable);
    }
}

TEST_CASE("Native input orders", "[hook]") {
    Market m;
    PoolKey key{NATIVE, TOKEN0, fees::FEE_030, 30, m.hook.address()};
    m.manager.initialize(key, 0);
    m.router.modify_liquidity(LP, key, {static_cast<I128>(1000 * E18), 0});

    m.hook.place_order(ALICE, key, 0, true, ORDER);
    REQUIRE(m.tokens.native_balance(m.hook.address()) == ORDER);

    m.swap_exact_in(TRADER, key, false, 5 * E18);
    OrderId id = LimitOrderHook::order_id(key, 0, true);
    REQUIRE(m.hook.pending_orders(key, 0, true) == 0);
    REQUIRE(m.tokens.native_balance(m.hook.address()) == 0);

    U128 out = m.hook.redeem(ALICE, key, 0, true, ORDER);
    REQUIRE(out == 10069698056891847);
    REQUIRE(m.hook.claimable_output(id) == 0);
}
