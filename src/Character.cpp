/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Character.hpp"

#include <utility>

namespace fray {

Character::Character(std::string name, Kind kind, int hp)
    : name_(std::move(name)), kind_(kind), hp_(hp), hp_max_(hp) {
    abilities_.fill(DefaultAbilityBonus);
}

int Character::ability_bonus(Ability ability) const {
    if (ability == Ability::Armor)
        return armor();
    return abilities_[ability];
}

void Character::ability_bonus(Ability ability, int bonus) { abilities_[ability] = bonus; }

int Character::armor() const { return base_armor_ + equipment_.armor_bonus(); }

bool Character::is_hostile_to(const Combatant &other) const {
    if (const auto *character = dynamic_cast<const Character *>(&other))
        return character->kind_ != kind_;
    return false;
}

void Character::send_to(std::string_view text) { output_.emplace_back(text); }

void Character::at_defeat() {
    ++times_defeated_;
    if (kind_ == Kind::Player)
        send_to("|RYou have been defeated!|w");
}

}
