/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Character.hpp"
#include "CombatHandler.hpp"
#include "CombatRegistry.hpp"
#include "Logging.hpp"
#include "Rng.hpp"
#include "Room.hpp"
#include "common/Configuration.hpp"

namespace test {

// A player and a goblin squaring up in an otherwise empty room. Every roll comes out as rng's
// current result: with the default abilities a roll of 11 succeeds and a roll of 8 fails, and
// damage from bare hands equals the roll.
struct CombatFixture {
    fray::FakeRng rng{10};
    fray::Logger logger{fray::null_logger()};
    fray::Configuration config;
    fray::CombatRegistry registry{rng, logger, config};
    fray::Room room{"the yard", logger};
    fray::Character alice{"Alice", fray::Character::Kind::Player};
    fray::Character goblin{"Goblin", fray::Character::Kind::Mob};

    CombatFixture() {
        room.enter(alice);
        room.enter(goblin);
    }

    fray::CombatHandler &start_fight() { return registry.join_combat(alice, goblin); }

    // Adds another combatant to the room, and to the fight if there is one.
    void join(fray::Character &character) {
        room.enter(character);
        if (auto *handler = registry.handler_for(alice))
            handler->add_combatant(character);
    }
};

}
