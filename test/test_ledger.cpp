// synx - Position Ledger Tests

#include "test_support.hpp"

#include <synx/authority.hpp>
#include <synx/ledger.hpp>

using namespace synx;
using synx::testing::error_of;

namespace {

struct LedgerFixture {
    SXAuthority authority{"admin"};
    ProtocolParams params;
    SXLedger ledger{authority, params};

    static PriceQuote fresh(Amount price = PRICE_ONE) { return PriceQuote{price, 0, true}; }
    static PriceQuote stale(Amount price = PRICE_ONE) { return PriceQuote{price, 0, false}; }
};

} // namespace

TEST_CASE("Deposit", "[ledger]") {
    LedgerFixture f;

    SECTION("Opens and credits a position") {
        f.ledger.apply_deposit("alice", 200, 5);

        auto pos = f.ledger.get("alice");
        REQUIRE(pos.has_value());
        REQUIRE(pos->collateral_deposited == Amount(200));
        REQUIRE(pos->synthetic_minted == Amount(0));
        REQUIRE(pos->last_interaction_block == 5);
        REQUIRE(pos->position_health.is_unbounded());
        REQUIRE(f.ledger.total_collateral() == Amount(200));
    }

    SECTION("Accumulates and keeps health") {
        f.ledger.apply_deposit("alice", 200, 0);
        f.ledger.apply_mint("alice", 100, 10, LedgerFixture::fresh());
        Health before = f.ledger.get("alice")->position_health;

        f.ledger.apply_deposit("alice", 50, 12);
        auto pos = f.ledger.get("alice");
        REQUIRE(pos->collateral_deposited == Amount(250));
        REQUIRE(pos->synthetic_minted == Amount(100));
        REQUIRE(pos->position_health == before);
        REQUIRE(pos->last_interaction_block == 12);
    }

    SECTION("Zero amount") {
        REQUIRE(error_of([&] { f.ledger.apply_deposit("alice", 0, 0); }) == Errc::InvalidAmount);
        REQUIRE_FALSE(f.ledger.exists("alice"));
    }

    SECTION("Paused before amount check") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.ledger.apply_deposit("alice", 0, 0); }) == Errc::ContractPaused);
        REQUIRE(error_of([&] { f.ledger.apply_deposit("alice", 10, 0); }) == Errc::ContractPaused);
        REQUIRE(f.ledger.total_collateral() == Amount(0));
    }

    SECTION("Total overflow leaves state untouched") {
        f.ledger.apply_deposit("alice", ~Amount(0), 0);
        REQUIRE(error_of([&] { f.ledger.apply_deposit("bob", 1, 0); }) == Errc::ArithmeticError);
        REQUIRE_FALSE(f.ledger.exists("bob"));
        REQUIRE(f.ledger.total_collateral() == ~Amount(0));
    }

    SECTION("Reconciliation holds across accounts") {
        f.ledger.apply_deposit("alice", 200, 0);
        f.ledger.apply_deposit("bob", 75, 1);
        f.ledger.apply_deposit("alice", 25, 2);

        Amount sum = 0;
        for (const auto& [account, pos] : f.ledger.positions()) {
            sum += pos.collateral_deposited;
        }
        REQUIRE(sum == f.ledger.total_collateral());
        REQUIRE(f.ledger.size() == 2);
    }
}

TEST_CASE("Open or get", "[ledger]") {
    LedgerFixture f;

    Position fresh = f.ledger.open_or_get("alice");
    REQUIRE(fresh == Position{});
    REQUIRE_FALSE(f.ledger.exists("alice"));
}

TEST_CASE("Mint", "[ledger][mint]") {
    LedgerFixture f;
    f.ledger.apply_deposit("alice", 200, 0);

    SECTION("Capacity scenario") {
        Amount net = f.ledger.apply_mint("alice", 100, 10, LedgerFixture::fresh());
        REQUIRE(net == Amount(100));   // fee truncates to zero

        auto pos = f.ledger.get("alice");
        REQUIRE(pos->synthetic_minted == Amount(100));
        REQUIRE(pos->position_health.value() == Amount(200));
        REQUIRE(pos->last_interaction_block == 10);
        REQUIRE(f.ledger.total_synthetic_supply() == Amount(100));

        // 140 > 133, inside and outside the cooldown window
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 40, 10, LedgerFixture::fresh()); })
                == Errc::InsufficientCollateral);
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 40, 50, LedgerFixture::fresh()); })
                == Errc::InsufficientCollateral);

        // 133 is exactly at capacity
        REQUIRE(f.ledger.apply_mint("alice", 33, 50, LedgerFixture::fresh()) == Amount(33));
    }

    SECTION("Cooldown blocks a sufficient mint") {
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 1, 9, LedgerFixture::fresh()); })
                == Errc::InvalidAmount);
        REQUIRE(f.ledger.get("alice")->synthetic_minted == Amount(0));
        REQUIRE(f.ledger.apply_mint("alice", 1, 10, LedgerFixture::fresh()) == Amount(1));
    }

    SECTION("Deposit restarts the cooldown") {
        f.ledger.apply_deposit("alice", 10, 15);
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 1, 20, LedgerFixture::fresh()); })
                == Errc::InvalidAmount);
    }

    SECTION("Missing position comes first") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.ledger.apply_mint("bob", 0, 10, LedgerFixture::stale()); })
                == Errc::PositionNotFound);
    }

    SECTION("Paused") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 10, 10, LedgerFixture::fresh()); })
                == Errc::ContractPaused);
    }

    SECTION("Zero amount") {
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 0, 10, LedgerFixture::fresh()); })
                == Errc::InvalidAmount);
    }

    SECTION("Stale price before capacity") {
        REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 1000, 10, LedgerFixture::stale()); })
                == Errc::StalePrice);
    }

    SECTION("Failed mint changes nothing") {
        Position before = *f.ledger.get("alice");
        REQUIRE_THROWS_AS(f.ledger.apply_mint("alice", 500, 10, LedgerFixture::fresh()), SXError);
        REQUIRE(*f.ledger.get("alice") == before);
        REQUIRE(f.ledger.total_synthetic_supply() == Amount(0));
    }
}

TEST_CASE("Minting fee", "[ledger][mint]") {
    LedgerFixture f;
    f.ledger.apply_deposit("alice", 3000000, 0);

    REQUIRE(f.ledger.minting_fee(10000) == Amount(50));
    REQUIRE(f.ledger.apply_mint("alice", 10000, 10, LedgerFixture::fresh()) == Amount(9950));

    // debt and supply carry the gross amount
    REQUIRE(f.ledger.get("alice")->synthetic_minted == Amount(10000));
    REQUIRE(f.ledger.total_synthetic_supply() == Amount(10000));
}

TEST_CASE("Mint capacity over sampled inputs", "[ledger][mint]") {
    const Amount collaterals[] = {150, 200, 1000, 123456789};
    const Amount prices[] = {50000000, PRICE_ONE, 3 * PRICE_ONE};

    for (Amount collateral : collaterals) {
        for (Amount price : prices) {
            LedgerFixture f;
            f.ledger.apply_deposit("alice", collateral, 0);

            Amount cap = math::max_mintable(collateral, price, 150);
            REQUIRE(cap > 0);

            REQUIRE(error_of([&] { f.ledger.apply_mint("alice", cap + 1, 10, LedgerFixture::fresh(price)); })
                    == Errc::InsufficientCollateral);
            REQUIRE_NOTHROW(f.ledger.apply_mint("alice", cap, 10, LedgerFixture::fresh(price)));
            REQUIRE(error_of([&] { f.ledger.apply_mint("alice", 1, 30, LedgerFixture::fresh(price)); })
                    == Errc::InsufficientCollateral);
        }
    }
}

TEST_CASE("Ledger transactions", "[ledger][txn]") {
    LedgerFixture f;

    SECTION("Uncommitted transaction is discarded") {
        {
            LedgerTxn txn = f.ledger.begin();
            f.ledger.apply_deposit(txn, "alice", 200, 0);
            REQUIRE(txn.total_collateral() == Amount(200));
        }
        REQUIRE_FALSE(f.ledger.exists("alice"));
        REQUIRE(f.ledger.total_collateral() == Amount(0));
    }

    SECTION("Staged operations compose") {
        LedgerTxn txn = f.ledger.begin();
        f.ledger.apply_deposit(txn, "alice", 200, 0);
        f.ledger.apply_deposit(txn, "bob", 100, 0);
        REQUIRE(txn.is_staged("alice"));
        txn.commit();

        REQUIRE(txn.committed());
        REQUIRE(f.ledger.size() == 2);
        REQUIRE(f.ledger.total_collateral() == Amount(300));
    }
}
