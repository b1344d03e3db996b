/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "AdvantageMatrix.hpp"
#include "Character.hpp"

#include <catch2/catch.hpp>

using namespace fray;

TEST_CASE("advantage matrix") {
    AdvantageMatrix matrix;
    Character alice{"Alice", Character::Kind::Player};
    Character bob{"Bob", Character::Kind::Player};
    Character goblin{"Goblin", Character::Kind::Mob};

    SECTION("starts empty") {
        CHECK(matrix.empty());
        CHECK(!matrix.has(alice, goblin));
    }
    SECTION("flags are per ordered pair") {
        matrix.give(alice, goblin);
        CHECK(matrix.has(alice, goblin));
        CHECK(!matrix.has(goblin, alice));
        CHECK(!matrix.has(bob, goblin));
        CHECK(!matrix.has(alice, bob));
        CHECK(matrix.size() == 1);
    }
    SECTION("giving twice is one flag") {
        matrix.give(alice, goblin);
        matrix.give(alice, goblin);
        CHECK(matrix.size() == 1);
    }
    SECTION("consuming uses the flag up") {
        matrix.give(alice, goblin);
        CHECK(matrix.consume(alice, goblin));
        CHECK(!matrix.consume(alice, goblin));
        CHECK(matrix.empty());
    }
    SECTION("targets of a holder") {
        matrix.give(alice, goblin);
        matrix.give(alice, bob);
        auto targets = matrix.targets_of(alice);
        CHECK(targets.size() == 2);
        CHECK(matrix.targets_of(goblin).empty());
    }
    SECTION("purging drops rows and columns") {
        matrix.give(alice, goblin);
        matrix.give(goblin, bob);
        matrix.give(bob, alice);
        matrix.purge(goblin);
        CHECK(!matrix.has(alice, goblin));
        CHECK(!matrix.has(goblin, bob));
        CHECK(matrix.has(bob, alice));
        CHECK(matrix.size() == 1);
    }
}
