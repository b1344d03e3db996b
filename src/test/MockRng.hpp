/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Rng.hpp"

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

namespace test {

struct MockRng : fray::Rng {
    MAKE_MOCK2(number_range, int(int, int), noexcept);
    MAKE_MOCK2(dice, int(int, int), noexcept);
};

}
