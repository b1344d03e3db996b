/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatRegistry.hpp"
#include "Character.hpp"

#include <catch2/catch.hpp>

#include "CombatFixture.hpp"

using namespace fray;

TEST_CASE("combat registry") {
    test::CombatFixture fixture;
    auto &registry = fixture.registry;

    SECTION("starts a fight for someone who isn't in one") {
        auto &handler = registry.get_or_create(fixture.alice);
        CHECK(handler.id() == 1u);
        CHECK(handler.is_engaged(fixture.alice));
        CHECK(&handler.location() == &fixture.room);
        CHECK(registry.handler_for(fixture.alice) == &handler);
        CHECK(registry.num_handlers() == 1);
        SECTION("and hands back the same fight afterwards") {
            CHECK(&registry.get_or_create(fixture.alice) == &handler);
            CHECK(registry.num_handlers() == 1);
        }
    }
    SECTION("nobody is fighting to start with") {
        CHECK(registry.handler_for(fixture.alice) == nullptr);
        CHECK(registry.num_handlers() == 0);
    }
    SECTION("can't start a fight nowhere") {
        Character ghost{"Ghost", Character::Kind::Mob};
        CHECK_THROWS_AS(registry.get_or_create(ghost), CombatNotAllowed);
        CHECK(registry.num_handlers() == 0);
    }
    SECTION("can't start a fight where fighting isn't allowed") {
        fixture.room.allows_combat(false);
        CHECK_THROWS_WITH(registry.get_or_create(fixture.alice), "Fighting isn't allowed where Alice is");
    }
    SECTION("joining") {
        SECTION("puts two idle combatants in a new fight") {
            auto &handler = registry.join_combat(fixture.alice, fixture.goblin);
            CHECK(handler.combatants().size() == 2);
            CHECK(registry.handler_for(fixture.goblin) == &handler);
        }
        SECTION("brings the attacker into the target's fight") {
            auto &handler = registry.get_or_create(fixture.goblin);
            CHECK(&registry.join_combat(fixture.alice, fixture.goblin) == &handler);
            CHECK(handler.combatants()[1].combatant == &fixture.alice);
        }
        SECTION("won't merge two fights") {
            Character bob{"Bob", Character::Kind::Player};
            Character orc{"Orc", Character::Kind::Mob};
            fixture.room.enter(bob);
            fixture.room.enter(orc);
            registry.join_combat(fixture.alice, fixture.goblin);
            registry.join_combat(bob, orc);
            CHECK_THROWS_AS(registry.join_combat(fixture.alice, orc), CombatNotAllowed);
        }
    }
    SECTION("garbage collection only removes stopped fights") {
        Character bob{"Bob", Character::Kind::Player};
        Character orc{"Orc", Character::Kind::Mob};
        fixture.room.enter(bob);
        fixture.room.enter(orc);
        auto &first = registry.join_combat(fixture.alice, fixture.goblin);
        auto &second = registry.join_combat(bob, orc);
        first.stop_combat();

        CHECK(registry.collect_garbage() == 1);
        CHECK(registry.num_handlers() == 1);
        CHECK(registry.handler_for(bob) == &second);
        CHECK(registry.collect_garbage() == 0);
    }
}
