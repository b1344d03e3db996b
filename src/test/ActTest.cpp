/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Act.hpp"
#include "Character.hpp"

#include <catch2/catch.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>

using namespace fray;

namespace {

struct ActFixture {
    std::ostringstream log;
    Logger logger{"act", std::make_shared<spdlog::sinks::ostream_sink_st>(log)};
    Character alice{"Alice", Character::Kind::Player};
    Character goblin{"Goblin", Character::Kind::Mob};
    Character bob{"Bob", Character::Kind::Player};
    NameMapping mapping{{"Alice", &alice}, {"Goblin", &goblin}, {"Bob", &bob}};

    std::string act(std::string_view format, const Combatant &to, const Combatant *from) {
        return format_act(format, to, from, mapping, logger);
    }
};

}

TEST_CASE("format act") {
    ActFixture fixture;
    auto &alice = fixture.alice;
    auto &goblin = fixture.goblin;
    auto &bob = fixture.bob;

    SECTION("the actor reads you and the verb as-is") {
        CHECK(fixture.act("$You() $conj(hit) $you(Goblin).", alice, &alice) == "You hit Goblin.");
    }
    SECTION("the target reads you and a conjugated verb") {
        CHECK(fixture.act("$You() $conj(hit) $you(Goblin).", goblin, &alice) == "Alice hits you.");
    }
    SECTION("bystanders read names") {
        CHECK(fixture.act("$You() $conj(hit) $you(Goblin).", bob, &alice) == "Alice hits Goblin.");
    }
    SECTION("possessives") {
        CHECK(fixture.act("$Your() sword strikes $your(Goblin) shield.", alice, &alice)
              == "Your sword strikes Goblin's shield.");
        CHECK(fixture.act("$Your() sword strikes $your(Goblin) shield.", goblin, &alice)
              == "Alice's sword strikes your shield.");
    }
    SECTION("irregular verbs") {
        CHECK(fixture.act("$You() $conj(are) ready.", bob, &alice) == "Alice is ready.");
        CHECK(fixture.act("$You() $conj(try) harder.", bob, &alice) == "Alice tries harder.");
        CHECK(fixture.act("$You() $conj(parry).", bob, &alice) == "Alice parries.");
        CHECK(fixture.act("$You() $conj(punch).", bob, &alice) == "Alice punches.");
    }
    SECTION("the first letter is upper-cased past colour codes") {
        CHECK(fixture.act("|r$you(Goblin) $conj(fall).|w", bob, &goblin) == "|rGoblin falls.|w");
    }
    SECTION("double dollars") { CHECK(fixture.act("costs 5$$", bob, nullptr) == "Costs 5$"); }
    SECTION("no speaker is someone") {
        CHECK(fixture.act("$You() $conj(shout).", bob, nullptr) == "Someone shouts.");
        CHECK(fixture.log.str().find("without a speaker") != std::string::npos);
    }
    SECTION("unknown names are left as they are and reported") {
        CHECK(fixture.act("$You() $conj(see) $you(Nobody).", alice, &alice) == "You see Nobody.");
        CHECK(fixture.log.str().find("no combatant called 'Nobody'") != std::string::npos);
    }
    SECTION("bad codes are left in and reported") {
        CHECK(fixture.act("$You() $jump(high).", alice, &alice) == "You $jump(high).");
        CHECK(fixture.log.str().find("bad code $jump") != std::string::npos);
    }
    SECTION("malformed codes are left in and reported") {
        CHECK(fixture.act("costs $5", alice, &alice) == "Costs $5");
        CHECK(fixture.log.str().find("malformed code") != std::string::npos);
    }
}
