/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <magic_enum.hpp>
#include <range/v3/view/filter.hpp>

namespace fray {

// Where an item goes when it's equipped. Backpack means the item is carried but not in use.
enum class WieldLocation { WeaponHand, ShieldHand, TwoHands, Body, Head, Backpack };

struct WieldFilter {
    // Locations that are slots holding at most one item.
    [[nodiscard]] static auto slots() noexcept {
        return magic_enum::enum_values<WieldLocation>()
               | ranges::views::filter([](const auto w) { return w != WieldLocation::Backpack; });
    }
    ~WieldFilter() = delete;
};

}
