/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Dice.hpp"

#include <catch2/catch.hpp>

#include "CatchFormatters.hpp"
#include "MockRng.hpp"

using namespace fray;

TEST_CASE("Dice tests") {
    SECTION("should be zero by default") {
        Dice dice;
        CHECK(dice.number() == 0);
        CHECK(dice.type() == 0);
        CHECK(dice.bonus() == 0);
    }
    SECTION("should construct correctly") {
        Dice dice(2, 3, 4);
        CHECK(dice.number() == 2);
        CHECK(dice.type() == 3);
        CHECK(dice.bonus() == 4);
    }
    SECTION("should display appropriately") {
        CHECK(fmt::to_string(Dice(1, 2, 3)) == "1d2+3");
        CHECK(fmt::to_string(Dice(5, 6)) == "5d6");
        CHECK(fmt::to_string(Dice(1, 8, -1)) == "1d8-1");
    }
    SECTION("should roll correctly") {
        test::MockRng rng;
        REQUIRE_CALL(rng, dice(5, 6)).RETURN(13);
        CHECK(Dice(5, 6, 2).roll(rng) == 13 + 2);
    }
    SECTION("should parse from strings") {
        SECTION("with d") { CHECK(Dice::from_string("1d10+2") == Dice(1, 10, 2)); }
        SECTION("with D") { CHECK(Dice::from_string("6D13") == Dice(6, 13)); }
        SECTION("with a penalty") { CHECK(Dice::from_string("1d8-1") == Dice(1, 8, -1)); }
        SECTION("rejecting nonsense") {
            CHECK(!Dice::from_string(""));
            CHECK(!Dice::from_string("d6"));
            CHECK(!Dice::from_string("1d"));
            CHECK(!Dice::from_string("1x6"));
            CHECK(!Dice::from_string("1d6+"));
            CHECK(!Dice::from_string("1d6+2 "));
            CHECK(!Dice::from_string("0d6"));
        }
    }
}

TEST_CASE("Rng tests") {
    SECTION("dice sum number_range rolls") {
        test::MockRng rng;
        REQUIRE_CALL(rng, number_range(1, 6)).TIMES(3).RETURN(4);
        CHECK(rng.Rng::dice(3, 6) == 12);
    }
    SECTION("one sided dice don't need rolling") {
        test::MockRng rng;
        FORBID_CALL(rng, number_range(trompeloeil::_, trompeloeil::_));
        CHECK(rng.Rng::dice(3, 1) == 3);
        CHECK(rng.Rng::dice(3, 0) == 0);
    }
    SECTION("seeded rolls stay in range") {
        SeededRng rng(1234);
        for (auto i = 0; i < 100; ++i) {
            const auto roll = rng.number_range(1, 20);
            REQUIRE(roll >= 1);
            REQUIRE(roll <= 20);
        }
        CHECK(rng.number_range(5, 5) == 5);
    }
    SECTION("seeded rolls repeat for the same seed") {
        SeededRng first(99);
        SeededRng second(99);
        for (auto i = 0; i < 10; ++i)
            CHECK(first.number_range(1, 100) == second.number_range(1, 100));
    }
    SECTION("fake rolls are whatever they're told") {
        FakeRng rng(7);
        CHECK(rng.number_range(1, 4) == 7);
        CHECK(rng.dice(2, 4) == 14);
        rng.result(3);
        CHECK(rng.number_range(1, 20) == 3);
    }
}
