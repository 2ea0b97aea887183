// synx - Price Feed Tests

#include "test_support.hpp"

#include <synx/authority.hpp>
#include <synx/feed.hpp>
#include <synx/registry.hpp>

using namespace synx;
using synx::testing::error_of;

namespace {

struct FeedFixture {
    SXAuthority authority{"admin"};
    SXRegistry registry{authority};
    SXFeed feed{registry, authority};

    FeedFixture() {
        registry.register_oracle("admin", "oracle-1");
    }
};

} // namespace

TEST_CASE("Price submission", "[feed]") {
    FeedFixture f;

    SECTION("Confidence below minimum is rejected") {
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, 90000000, 59, 0); }) == Errc::InvalidAmount);
        REQUIRE(f.feed.current_price() == Amount(0));
        REQUIRE(f.feed.submission_nonce() == 0);
    }

    SECTION("Confidence at minimum is accepted") {
        uint64_t id = f.feed.submit("oracle-1", 1, 90000000, 60, 7);
        REQUIRE(id == 1);
        REQUIRE(f.feed.current_price() == Amount(90000000));
        REQUIRE(f.feed.last_update() == 7);
        REQUIRE(f.registry.get("oracle-1")->total_submissions == 1);

        auto stored = f.feed.get_submission(1, id);
        REQUIRE(stored.has_value());
        REQUIRE(stored->oracle == Identity("oracle-1"));
        REQUIRE(stored->confidence == 60);
        REQUIRE(stored->timestamp == 7);
    }

    SECTION("Confidence above 100 is rejected") {
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, PRICE_ONE, 101, 0); }) == Errc::InvalidAmount);
    }

    SECTION("Out-of-range confidence is not truncated into range") {
        f.feed.submit("oracle-1", 1, PRICE_ONE, 90, 0);

        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, 90000000, 316, 1); }) == Errc::InvalidAmount);
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, 90000000, 356, 1); }) == Errc::InvalidAmount);
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, 90000000, uint64_t(1) << 32, 1); })
                == Errc::InvalidAmount);

        REQUIRE(f.feed.current_price() == PRICE_ONE);
        REQUIRE(f.feed.last_update() == 0);
        REQUIRE(f.feed.submission_nonce() == 1);
        REQUIRE(f.registry.get("oracle-1")->total_submissions == 1);
    }

    SECTION("Zero price is rejected") {
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, 0, 90, 0); }) == Errc::InvalidAmount);
    }

    SECTION("Unregistered oracle") {
        REQUIRE(error_of([&] { f.feed.submit("stranger", 1, PRICE_ONE, 90, 0); }) == Errc::OracleNotRegistered);
    }

    SECTION("Paused feed") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, PRICE_ONE, 90, 0); }) == Errc::ContractPaused);
        REQUIRE(f.registry.get("oracle-1")->total_submissions == 0);
    }

    SECTION("Registration is checked before the pause") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.feed.submit("stranger", 1, PRICE_ONE, 90, 0); }) == Errc::OracleNotRegistered);
    }

    SECTION("Pause is checked before confidence") {
        f.authority.pause("admin");
        REQUIRE(error_of([&] { f.feed.submit("oracle-1", 1, PRICE_ONE, 10, 0); }) == Errc::ContractPaused);
    }
}

TEST_CASE("Single global price across assets", "[feed]") {
    FeedFixture f;

    uint64_t first = f.feed.submit("oracle-1", 1, PRICE_ONE, 90, 0);
    uint64_t second = f.feed.submit("oracle-1", 2, 3 * PRICE_ONE, 90, 1);

    // ids are per feed, not per asset
    REQUIRE(first == 1);
    REQUIRE(second == 2);

    // the latest submission for any asset wins
    REQUIRE(f.feed.current_price() == 3 * PRICE_ONE);

    REQUIRE(f.feed.get_submission(1, 1).has_value());
    REQUIRE_FALSE(f.feed.get_submission(2, 1).has_value());
    REQUIRE(f.feed.submissions_for(2).size() == 1);
}

TEST_CASE("Price freshness", "[feed]") {
    SECTION("Window boundaries") {
        REQUIRE(SXFeed::is_fresh(0, 99, 100));
        REQUIRE_FALSE(SXFeed::is_fresh(0, 100, 100));
        REQUIRE(SXFeed::is_fresh(50, 50, 100));
        REQUIRE(SXFeed::is_fresh(60, 50, 100));
    }

    SECTION("No accepted price is stale") {
        FeedFixture f;
        REQUIRE_FALSE(f.feed.quote(0).fresh);
        REQUIRE(error_of([&] { f.feed.require_fresh(0); }) == Errc::StalePrice);
    }

    SECTION("Quote follows the clock") {
        FeedFixture f;
        f.feed.submit("oracle-1", 1, PRICE_ONE, 90, 10);

        REQUIRE(f.feed.require_fresh(109) == PRICE_ONE);
        REQUIRE(f.feed.quote(109).fresh);
        REQUIRE_FALSE(f.feed.quote(110).fresh);
        REQUIRE(error_of([&] { f.feed.require_fresh(110); }) == Errc::StalePrice);
    }

    SECTION("Repeated reads are identical") {
        FeedFixture f;
        f.feed.submit("oracle-1", 1, 123456789, 90, 0);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(f.feed.current_price() == Amount(123456789));
        }
    }
}

TEST_CASE("Credibility-weighted price", "[feed]") {
    FeedFixture f;
    f.registry.register_oracle("admin", "oracle-2");
    f.registry.register_oracle("admin", "oracle-3");

    f.feed.submit("oracle-1", 1, 100, 90, 0);
    f.feed.submit("oracle-2", 1, 300, 90, 0);
    f.feed.submit("oracle-3", 1, 200, 90, 0);

    SECTION("Median of equal weights") {
        REQUIRE(f.feed.weighted_price(1, 5) == std::optional<Amount>(200));
    }

    SECTION("Latest submission per oracle") {
        f.feed.submit("oracle-2", 1, 150, 90, 1);
        // prices 100, 150, 200
        REQUIRE(f.feed.weighted_price(1, 5) == std::optional<Amount>(150));
    }

    SECTION("Stale submissions are excluded") {
        REQUIRE_FALSE(f.feed.weighted_price(1, 100).has_value());
    }

    SECTION("Unknown asset") {
        REQUIRE_FALSE(f.feed.weighted_price(9, 5).has_value());
    }

    SECTION("Submissions leave every weight at the initial credibility") {
        for (const char* id : {"oracle-1", "oracle-2", "oracle-3"}) {
            REQUIRE(f.registry.get(id)->credibility_score == 100);
        }
    }

    SECTION("Even count takes the lower middle") {
        f.registry.register_oracle("admin", "oracle-4");
        f.feed.submit("oracle-4", 1, 400, 90, 0);
        // prices 100, 200, 300, 400
        REQUIRE(f.feed.weighted_price(1, 5) == std::optional<Amount>(200));
    }
}

TEST_CASE("Zero initial credibility disables the weighted price", "[feed]") {
    SXAuthority authority{"admin"};
    SXRegistry registry{authority, 0};
    SXFeed feed{registry, authority};
    registry.register_oracle("admin", "oracle-1");

    feed.submit("oracle-1", 1, PRICE_ONE, 90, 0);

    REQUIRE(feed.current_price() == PRICE_ONE);
    REQUIRE_FALSE(feed.weighted_price(1, 5).has_value());
}
