/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "PerEnum.hpp"
#include "WieldLocation.hpp"

#include <vector>

namespace fray {

class Item;

// A combatant's worn and carried items. Each slot holds at most one item, and the hand slots
// are mutually exclusive with the two-handed slot. Items are referenced, never owned.
class Equipment {
public:
    Equipment() = default;

    // Equips an item in its wield location, moving whatever it displaces into the backpack. Two-handed
    // items displace both hand slots; weapon or shield hand items displace a two-handed item.
    // Moving an item that's already in its slot leaves everything as it was.
    void move(Item &item);
    // Drops the item from every slot and the backpack. Returns false if it wasn't carried at all.
    bool remove(const Item &item);

    [[nodiscard]] Item *slot(WieldLocation location) const;
    [[nodiscard]] const std::vector<Item *> &backpack() const noexcept { return backpack_; }
    [[nodiscard]] bool is_carrying(const Item &item) const;

    // The wielded weapon: the two-handed item, else the weapon hand item, else bare hands.
    [[nodiscard]] const Item &weapon() const;
    // Armor from the shield hand, body and head items.
    [[nodiscard]] int armor_bonus() const;

private:
    PerEnum<WieldLocation, Item *> slots_;
    std::vector<Item *> backpack_;
};

}
