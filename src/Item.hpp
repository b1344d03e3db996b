/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Ability.hpp"
#include "Dice.hpp"
#include "WieldLocation.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fray {

class Combatant;
class Rng;

// How an item performs when it's swung at someone: the ability the wielder attacks with,
// the ability (or armor) the target defends with and the damage dealt on a hit.
struct WeaponProfile {
    Ability attack_type{Ability::Str};
    Ability defense_type{Ability::Armor};
    Dice damage{1, 4};
};

// Anything a combatant can carry, wield or use. Items are owned outside of combat; a handler
// and its actions only ever refer to them.
class Item {
public:
    Item(std::string name, WieldLocation location, WeaponProfile weapon = {}, int armor = 0,
         std::optional<int> uses = std::nullopt);
    virtual ~Item() = default;
    Item(const Item &) = delete;
    Item &operator=(const Item &) = delete;
    Item(Item &&) = delete;
    Item &operator=(Item &&) = delete;

    [[nodiscard]] std::string_view name() const noexcept { return name_; }
    [[nodiscard]] WieldLocation wield_location() const noexcept { return location_; }
    [[nodiscard]] const WeaponProfile &weapon_profile() const noexcept { return weapon_; }
    // Armor granted while worn on the body or head, or held in the shield hand.
    [[nodiscard]] int armor() const noexcept { return armor_; }

    // Remaining uses; nullopt for items that never run out.
    [[nodiscard]] std::optional<int> uses() const noexcept { return uses_; }
    void uses(int uses) noexcept { uses_ = uses; }
    [[nodiscard]] bool is_destroyed() const noexcept { return destroyed_; }
    [[nodiscard]] bool is_usable() const noexcept { return !destroyed_ && (!uses_ || *uses_ > 0); }

    // The item's own effect when used by user on target. Does not account for uses.
    virtual void apply_effect(Combatant &user, Combatant &target, Rng &rng);
    // Called once an item is used up. After this the item can no longer be used or wielded.
    virtual void destroy();

    // The item standing in for a weapon when nothing is wielded.
    [[nodiscard]] static const Item &bare_hands();

private:
    std::string name_;
    WieldLocation location_;
    WeaponProfile weapon_;
    int armor_;
    std::optional<int> uses_;
    bool destroyed_{};
};

// A single-target healing item such as a potion or a bandage.
class Consumable : public Item {
public:
    Consumable(std::string name, Dice healing, int uses);

    [[nodiscard]] const Dice &healing() const noexcept { return healing_; }
    void apply_effect(Combatant &user, Combatant &target, Rng &rng) override;

private:
    Dice healing_;
};

}
