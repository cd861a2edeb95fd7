// =============================================================================
// order_ledger.cpp - OrderLedger Implementation
// =============================================================================

#include "tickbook/order_ledger.hpp"

namespace tickbook {

OrderLedger::OrderLedger(Journal& journal) : Versioned(journal) {}

const PoolBook* OrderLedger::find_book(uint64_t pool_id) const {
    auto it = state_.books.find(pool_id);
    return it != state_.books.end() ? &it->second : nullptr;
}

// =============================================================================
// Pending Volume
// =============================================================================

U128 OrderLedger::pending(uint64_t pool_id, int32_t tick, bool zero_for_one) const {
    const PoolBook* book = find_book(pool_id);
    if (!book) return 0;

    const auto& levels = side(*book, zero_for_one);
    auto it = levels.find(tick);
    return it != levels.end() ? it->second : 0;
}

void OrderLedger::add_pending(uint64_t pool_id, int32_t tick, bool zero_for_one, U128 amount) {
    U128& level = side(state_.books[pool_id], zero_for_one)[tick];
    if (level > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "pending volume overflow at tick " + std::to_string(tick));
    }
    level += amount;
}

void OrderLedger::remove_pending(uint64_t pool_id, int32_t tick, bool zero_for_one, U128 amount) {
    U128 available = pending(pool_id, tick, zero_for_one);
    if (available < amount) {
        throw Error(errors::NOT_ENOUGH_TO_CLAIM,
                    "tick " + std::to_string(tick) + " holds " + to_string(available) +
                    " pending, requested " + to_string(amount));
    }
    if (amount == 0) return;
    side(state_.books[pool_id], zero_for_one)[tick] -= amount;
}

std::optional<int32_t> OrderLedger::first_pending(uint64_t pool_id, bool zero_for_one,
                                                  int32_t from, int32_t to) const {
    const PoolBook* book = find_book(pool_id);
    if (!book) return std::nullopt;

    const auto& levels = side(*book, zero_for_one);

    if (from <= to) {
        // Upward: ascending from `from`
        for (auto it = levels.lower_bound(from); it != levels.end() && it->first <= to; ++it) {
            if (it->second != 0) return it->first;
        }
    } else {
        // Downward: descending from `from`
        auto it = levels.upper_bound(from);
        while (it != levels.begin()) {
            --it;
            if (it->first < to) break;
            if (it->second != 0) return it->first;
        }
    }
    return std::nullopt;
}

size_t OrderLedger::nonzero_buckets(uint64_t pool_id) const {
    const PoolBook* book = find_book(pool_id);
    if (!book) return 0;

    size_t count = 0;
    for (const auto& [tick, volume] : book->sell0) {
        if (volume != 0) ++count;
    }
    for (const auto& [tick, volume] : book->sell1) {
        if (volume != 0) ++count;
    }
    return count;
}

// =============================================================================
// Claim Accounting
// =============================================================================

OrderInfo OrderLedger::order(const OrderId& id) const {
    auto it = state_.orders.find(id);
    return it != state_.orders.end() ? it->second : OrderInfo{};
}

void OrderLedger::add_claim_supply(const OrderId& id, U128 amount) {
    U128& supply = state_.orders[id].claim_supply;
    if (supply > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "claim supply overflow for " + id.to_hex());
    }
    supply += amount;
}

void OrderLedger::remove_claim_supply(const OrderId& id, U128 amount) {
    U128& supply = state_.orders[id].claim_supply;
    if (supply < amount) {
        throw Error(errors::NOT_ENOUGH_TO_CLAIM, "claim supply below " + to_string(amount));
    }
    supply -= amount;
}

void OrderLedger::add_claimable_output(const OrderId& id, U128 amount) {
    U128& output = state_.orders[id].claimable_output;
    if (output > U128_MAX - amount) {
        throw Error(errors::MATH_OVERFLOW, "claimable output overflow for " + id.to_hex());
    }
    output += amount;
}

void OrderLedger::remove_claimable_output(const OrderId& id, U128 amount) {
    U128& output = state_.orders[id].claimable_output;
    if (output < amount) {
        throw Error(errors::NOT_ENOUGH_TO_CLAIM, "claimable output below " + to_string(amount));
    }
    output -= amount;
}

// =============================================================================
// Last Observed Tick
// =============================================================================

std::optional<int32_t> OrderLedger::last_tick(uint64_t pool_id) const {
    const PoolBook* book = find_book(pool_id);
    return book ? book->last_tick : std::nullopt;
}

void OrderLedger::set_last_tick(uint64_t pool_id, int32_t tick) {
    state_.books[pool_id].last_tick = tick;
}

} // namespace tickbook
