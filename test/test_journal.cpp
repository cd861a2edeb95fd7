// Journal / Transaction rollback tests

#include "test_support.hpp"

using namespace tickbook;
using namespace tickbook::test;

namespace {

struct Counter : public Versioned<int> {
    explicit Counter(Journal& journal) : Versioned(journal) {}
    void add(int n) { state_ += n; }
    int value() const { return state_; }
};

} // namespace

TEST_CASE("Transaction commit and rollback", "[journal]") {
    Journal journal;
    Counter a(journal);
    Counter b(journal);
    REQUIRE(journal.size() == 2);

    SECTION("Committed writes persist") {
        {
            Transaction tx(journal);
            a.add(5);
            b.add(7);
            tx.commit();
        }
        REQUIRE(a.value() == 5);
        REQUIRE(b.value() == 7);
        REQUIRE(journal.depth() == 0);
    }

    SECTION("Scope exit without commit restores every store") {
        a.add(1);
        {
            Transaction tx(journal);
            a.add(10);
            b.add(10);
        }
        REQUIRE(a.value() == 1);
        REQUIRE(b.value() == 0);
        REQUIRE(journal.depth() == 0);
    }

    SECTION("Exceptions unwind the transaction") {
        auto failing = [&]() {
            Transaction tx(journal);
            a.add(3);
            throw Error(errors::INVALID_AMOUNT, "boom");
        };
        REQUIRE_ERROR_CODE(failing(), errors::INVALID_AMOUNT);
        REQUIRE(a.value() == 0);
    }

    SECTION("Nested transactions") {
        Transaction outer(journal);
        a.add(1);
        {
            Transaction inner(journal);
            a.add(100);
            REQUIRE(journal.depth() == 2);
        }
        REQUIRE(a.value() == 1);
        {
            Transaction inner(journal);
            b.add(2);
            inner.commit();
        }
        REQUIRE(b.value() == 2);
        outer.commit();
        REQUIRE(a.value() == 1);
        REQUIRE(b.value() == 2);
    }

    SECTION("Outer rollback discards committed inner work") {
        {
            Transaction outer(journal);
            Transaction inner(journal);
            a.add(9);
            inner.commit();
        }
        REQUIRE(a.value() == 0);
    }

    SECTION("Stores cannot join mid-transaction") {
        Transaction tx(journal);
        auto attach_late = [&]() { Counter late(journal); };
        REQUIRE_ERROR_CODE(attach_late(), errors::REENTRANCY);
    }
}
