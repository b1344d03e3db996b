/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

#include <string_view>
#include <variant>

namespace fray {

class Combatant;
class Item;

// What a combatant declares it will do this turn. Declarations only refer to combatants and items;
// nothing is checked or resolved until the turn executes.
namespace actions {

// Also what a combatant does when it declared nothing.
struct DoNothing {};

struct Attack {
    Combatant *target{};
};

// A contested trick (a feint, a trip, a distraction). On success recipient gains advantage against
// target, or if advantage is false, disadvantage against target.
struct Stunt {
    Combatant *recipient{};
    Combatant *target{};
    bool advantage{true};
    Ability stunt_type{Ability::Str};
    Ability defense_type{Ability::Dex};
};

struct UseItem {
    Item *item{};
    Combatant *target{};
};

struct Wield {
    Item *item{};
};

struct Flee {};

// Tries to stop target's retreat.
struct Hinder {
    Combatant *target{};
};

}

using Action = std::variant<actions::DoNothing, actions::Attack, actions::Stunt, actions::UseItem, actions::Wield,
                            actions::Flee, actions::Hinder>;

enum class ActionKey { Nothing, Attack, Stunt, Use, Wield, Flee, Hinder };

[[nodiscard]] ActionKey key_of(const Action &action) noexcept;
// The lower case name of a key, as a player would type it: "nothing", "attack", ...
[[nodiscard]] std::string_view to_string(ActionKey key);

}
