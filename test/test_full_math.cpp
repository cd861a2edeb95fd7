// 256-bit mul_div and fixed-point formatting tests

#include "test_support.hpp"

using namespace tickbook;
using namespace tickbook::test;

TEST_CASE("mul_div", "[full_math]") {
    SECTION("Small values") {
        REQUIRE(full_math::mul_div(6, 7, 3) == 14);
        REQUIRE(full_math::mul_div(7, 1, 2) == 3);
        REQUIRE(full_math::mul_div(0, 123, 7) == 0);
    }

    SECTION("Intermediate product wider than 128 bits") {
        U128 two_100 = static_cast<U128>(1) << 100;
        REQUIRE(full_math::mul_div(two_100, two_100, static_cast<U128>(1) << 120) ==
                (static_cast<U128>(1) << 80));
        REQUIRE(full_math::mul_div(U128_MAX, U128_MAX, U128_MAX) == U128_MAX);
        REQUIRE(full_math::mul_div(U128_MAX, 3, 4) == U128_MAX / 4 * 3 + 2);
    }

    SECTION("Pro-rata share of a bucket") {
        // 0.25 of 1.2345 output
        U128 claimable = 1234500000000000000;
        REQUIRE(full_math::mul_div(E18 / 4, claimable, E18) == 308625000000000000);
    }

    SECTION("Overflow and zero denominator") {
        REQUIRE_ERROR_CODE(full_math::mul_div(U128_MAX, 2, 1), errors::MATH_OVERFLOW);
        REQUIRE_ERROR_CODE(full_math::mul_div(1, 1, 0), errors::MATH_OVERFLOW);
    }
}

TEST_CASE("mul_div_up", "[full_math]") {
    REQUIRE(full_math::mul_div_up(7, 1, 2) == 4);
    REQUIRE(full_math::mul_div_up(6, 1, 2) == 3);
    REQUIRE(full_math::mul_div_up(U128_MAX, U128_MAX, U128_MAX) == U128_MAX);
    REQUIRE(full_math::mul_div_up(1000 * E18, E18, 999 * E18) == 1001001001001001002);
    REQUIRE_ERROR_CODE(full_math::mul_div_up(U128_MAX, U128_MAX, 1), errors::MATH_OVERFLOW);
}

TEST_CASE("Wide product", "[full_math]") {
    full_math::U256 p = full_math::mul_wide(static_cast<U128>(1) << 127, 4);
    REQUIRE(p.lo == 0);
    REQUIRE(p.hi == 2);

    full_math::U256 q = full_math::mul_wide(U128_MAX, U128_MAX);
    REQUIRE(q.lo == 1);
    REQUIRE(q.hi == U128_MAX - 1);
}

TEST_CASE("X18 decimal amounts", "[types]") {
    SECTION("Parse") {
        REQUIRE(x18::parse("1") == E18);
        REQUIRE(x18::parse("1.5") == E18 + E18 / 2);
        REQUIRE(x18::parse("0.01") == E18 / 100);
        REQUIRE(x18::parse(".5") == E18 / 2);
        REQUIRE(x18::parse("0.000000000000000001") == 1);
    }

    SECTION("Malformed input") {
        REQUIRE_ERROR_CODE(x18::parse(""), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(x18::parse("."), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(x18::parse("1.2.3"), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(x18::parse("-1"), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(x18::parse("0.0000000000000000001"), errors::INVALID_AMOUNT);
        REQUIRE_ERROR_CODE(x18::parse("1000000000000000000000000000000000000000"),
                           errors::MATH_OVERFLOW);
    }

    SECTION("Format") {
        REQUIRE(x18::format(0) == "0");
        REQUIRE(x18::format(E18) == "1");
        REQUIRE(x18::format(E18 / 100) == "0.01");
        REQUIRE(x18::format(2238229092588051852) == "2.238229092588051852");
    }

    SECTION("Signed and unsigned decimal strings") {
        REQUIRE(to_string(U128_MAX) == "340282366920938463463374607431768211455");
        REQUIRE(to_string(static_cast<I128>(-42)) == "-42");
        REQUIRE(to_string(static_cast<I128>(0)) == "0");
    }
}

TEST_CASE("Error carries its code", "[types]") {
    Error e(errors::NOTHING_TO_CLAIM, "order 7");
    REQUIRE(e.code() == errors::NOTHING_TO_CLAIM);
    REQUIRE(std::string(e.what()) == "NOTHING_TO_CLAIM: order 7");
    REQUIRE(std::string(errors::name(errors::FILL_BOUND_EXCEEDED)) == "FILL_BOUND_EXCEEDED");
}
