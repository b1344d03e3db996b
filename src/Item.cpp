/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Item.hpp"
#include "Combatant.hpp"
#include "Rng.hpp"

#include <algorithm>

namespace fray {

Item::Item(std::string name, WieldLocation location, WeaponProfile weapon, int armor, std::optional<int> uses)
    : name_(std::move(name)), location_(location), weapon_(weapon), armor_(armor), uses_(uses) {}

void Item::apply_effect(Combatant &, Combatant &, Rng &) {}

void Item::destroy() {
    destroyed_ = true;
    uses_ = 0;
}

const Item &Item::bare_hands() {
    static const Item bare_hands{"Empty Fists", WieldLocation::WeaponHand, WeaponProfile{}};
    return bare_hands;
}

Consumable::Consumable(std::string name, Dice healing, int uses)
    : Item(std::move(name), WieldLocation::Backpack, WeaponProfile{}, 0, uses), healing_(healing) {}

void Consumable::apply_effect(Combatant &, Combatant &target, Rng &rng) {
    const auto healed = std::max(0, healing_.roll(rng));
    target.hp(std::min(target.hp_max(), target.hp() + healed));
}

}
