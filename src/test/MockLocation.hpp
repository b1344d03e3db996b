/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Location.hpp"

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

namespace test {

struct MockLocation : fray::Location {
    MAKE_MOCK4(broadcast,
               void(std::string_view text, const fray::Combatant *from, const fray::Exclusions &exclude,
                    const fray::NameMapping &mapping),
               override);
    MAKE_CONST_MOCK0(allows_combat, bool(), override);
};

}
