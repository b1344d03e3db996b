/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

#include <string_view>

namespace fray {

class Equipment;
struct Location;

// What a participant must provide to take part in combat. Combatants are owned elsewhere (a player's
// session, a room's mob list); combat refers to them by address and mutates their state in place.
class Combatant {
public:
    virtual ~Combatant() = default;

    // The name others see, and the key it's known by in message templates.
    [[nodiscard]] virtual std::string_view name() const = 0;

    // Health may go negative. Zero or below means the combatant is down.
    [[nodiscard]] virtual int hp() const = 0;
    virtual void hp(int hp) = 0;
    [[nodiscard]] virtual int hp_max() const = 0;

    // The bonus added to checks made with the ability.
    [[nodiscard]] virtual int ability_bonus(Ability ability) const = 0;
    // The value an attack must beat when the defense is Ability::Armor.
    [[nodiscard]] virtual int armor() const = 0;

    [[nodiscard]] virtual Equipment &equipment() = 0;
    [[nodiscard]] virtual const Equipment &equipment() const = 0;

    // Decides sides: two combatants are on the same side if neither is hostile to the other.
    [[nodiscard]] virtual bool is_hostile_to(const Combatant &other) const = 0;

    [[nodiscard]] virtual Location *location() const = 0;

    // Delivers one already rendered line of text to the combatant.
    virtual void send_to(std::string_view text) = 0;

    // Called when the combatant is taken out of a fight because its health dropped to zero or below.
    virtual void at_defeat() {}

    [[nodiscard]] bool is_down() const { return hp() <= 0; }
};

}
