// synx - Fixed-Point Math Tests

#include "test_support.hpp"

#include <stdexcept>

using namespace synx;
using synx::testing::error_of;

TEST_CASE("Checked arithmetic", "[math]") {
    const Amount max = ~Amount(0);

    SECTION("Addition overflow") {
        REQUIRE(math::add(2, 3) == Amount(5));
        REQUIRE(error_of([&] { math::add(max, 1); }) == Errc::ArithmeticError);
    }

    SECTION("Subtraction underflow") {
        REQUIRE(math::sub(5, 5) == Amount(0));
        REQUIRE(error_of([] { math::sub(4, 5); }) == Errc::ArithmeticError);
    }

    SECTION("Multiplication overflow") {
        REQUIRE(math::mul(max, 1) == max);
        REQUIRE(error_of([&] { math::mul(max, 2); }) == Errc::ArithmeticError);
    }

    SECTION("Division truncates and rejects zero") {
        REQUIRE(math::div(7, 2) == Amount(3));
        REQUIRE(math::div(1, 3) == Amount(0));
        REQUIRE(error_of([] { math::div(1, 0); }) == Errc::ArithmeticError);
    }

    SECTION("Clock moving backwards") {
        REQUIRE(math::elapsed(5, 15) == 10u);
        REQUIRE(error_of([] { math::elapsed(15, 5); }) == Errc::ArithmeticError);
    }
}

TEST_CASE("Basis points and percentages", "[math]") {
    REQUIRE(math::bps(10000, 50) == Amount(50));
    REQUIRE(math::bps(100, 50) == Amount(0));       // 0.5 truncated
    REQUIRE(math::bps(199, 50) == Amount(0));
    REQUIRE(math::bps(200, 50) == Amount(1));
    REQUIRE(math::percent_of(85, 110) == Amount(93));
    REQUIRE(math::percent_of(85, 5) == Amount(4));
}

TEST_CASE("Position health", "[math][health]") {
    SECTION("Ratio") {
        Health h = math::position_health(200, 100, PRICE_ONE);
        REQUIRE_FALSE(h.is_unbounded());
        REQUIRE(h.value() == Amount(200));
        REQUIRE(h.encoded() == Amount(200));
    }

    SECTION("Truncates toward zero") {
        // 200 * 0.7 * 100 / 133 = 105.26
        Health h = math::position_health(200, 133, 70000000);
        REQUIRE(h.value() == Amount(105));
        REQUIRE(h.below(120));
        REQUIRE(h.at_least(105));
    }

    SECTION("Zero debt is unbounded for any collateral and price") {
        for (Amount c : {Amount(0), Amount(1), Amount(200), Amount(1) << 80}) {
            for (Amount p : {Amount(1), PRICE_ONE, Amount(7) * PRICE_ONE}) {
                Health h = math::position_health(c, 0, p);
                REQUIRE(h.is_unbounded());
                REQUIRE_FALSE(h.value().has_value());
                REQUIRE(h.encoded() == Amount(999999));
            }
        }
    }

    SECTION("Unbounded is never below a threshold") {
        Health h = Health::unbounded();
        REQUIRE_FALSE(h.below(120));
        REQUIRE_FALSE(h.below(Amount(10000000)));
        REQUIRE(h.at_least(150));
    }

    SECTION("Overflow is reported") {
        Amount huge = Amount(1) << 100;
        REQUIRE(error_of([&] { math::position_health(huge, 1, huge); }) == Errc::ArithmeticError);
    }
}

TEST_CASE("Max mintable", "[math]") {
    SECTION("Reference values") {
        REQUIRE(math::max_mintable(200, PRICE_ONE, 150) == Amount(133));
        REQUIRE(math::max_mintable(900, PRICE_ONE, 140) == Amount(642));
        REQUIRE(math::max_mintable(900, PRICE_ONE, 145) == Amount(620));
        REQUIRE(math::max_mintable(0, PRICE_ONE, 150) == Amount(0));
    }

    SECTION("Zero ratio is an arithmetic error") {
        REQUIRE(error_of([] { math::max_mintable(1, PRICE_ONE, 0); }) == Errc::ArithmeticError);
    }

    SECTION("Collateral for debt") {
        REQUIRE(math::collateral_for_debt(60, 70000000) == Amount(85));
        REQUIRE(math::collateral_for_debt(100, PRICE_ONE) == Amount(100));
    }
}

TEST_CASE("Decimal codec", "[math]") {
    SECTION("Formatting") {
        REQUIRE(math::to_string(0) == "0");
        REQUIRE(math::to_string(PRICE_ONE) == "100000000");
        REQUIRE(math::to_string(~Amount(0)) == "340282366920938463463374607431768211455");
    }

    SECTION("Parsing") {
        REQUIRE(math::from_string("90000000") == Amount(90000000));
        REQUIRE(math::from_string("340282366920938463463374607431768211455") == ~Amount(0));
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(math::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(math::from_string("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(math::from_string("-1"), std::invalid_argument);
        REQUIRE_THROWS_AS(math::from_string("340282366920938463463374607431768211456"),
                          std::out_of_range);
    }
}

TEST_CASE("Error kinds", "[math][errors]") {
    REQUIRE(std::string(to_string(Errc::StalePrice)) == "stale-price");
    REQUIRE(error_code(Errc::NotAuthorized) == errors::NOT_AUTHORIZED);
    REQUIRE(error_code(Errc::TransferFailed) == errors::TRANSFER_FAILED);

    SXError e(Errc::InvalidAmount, "zero");
    REQUIRE(e.code() == Errc::InvalidAmount);
    REQUIRE(std::string(e.what()) == "invalid-amount: zero");
}
