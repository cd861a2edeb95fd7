// =============================================================================
// journal.cpp - Checkpoint/rollback across all revertible stores
// =============================================================================

#include "tickbook/journal.hpp"
#include "tickbook/types.hpp"
#include <algorithm>

namespace tickbook {

void Journal::attach(Revertible* store) {
    if (depth_ != 0) {
        throw Error(errors::REENTRANCY, "cannot attach a store inside a transaction");
    }
    if (store && std::find(stores_.begin(), stores_.end(), store) == stores_.end()) {
        stores_.push_back(store);
    }
}

void Journal::detach(Revertible* store) {
    // Called from destructors; never throws
    stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
}

void Journal::begin() {
    for (Revertible* store : stores_) {
        store->checkpoint();
    }
    ++depth_;
}

void Journal::commit() {
    for (Revertible* store : stores_) {
        store->commit();
    }
    --depth_;
}

void Journal::rollback() {
    for (Revertible* store : stores_) {
        store->rollback();
    }
    --depth_;
}

Transaction::Transaction(Journal& journal) : journal_(journal) {
    journal_.begin();
}

Transaction::~Transaction() {
    if (!done_) {
        journal_.rollback();
    }
}

void Transaction::commit() {
    journal_.commit();
    done_ = true;
}

} // namespace tickbook
