/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Equipment.hpp"
#include "Item.hpp"

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/remove.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <array>

namespace fray {

namespace {

constexpr std::array ArmorSlots = {WieldLocation::ShieldHand, WieldLocation::Body, WieldLocation::Head};

}

void Equipment::move(Item &item) {
    const auto use_slot = item.wield_location();
    if (use_slot != WieldLocation::Backpack && slots_[use_slot] == &item)
        return;
    remove(item);
    std::vector<Item *> displaced;
    switch (use_slot) {
    case WieldLocation::TwoHands:
        displaced = {slots_[WieldLocation::WeaponHand], slots_[WieldLocation::ShieldHand],
                     slots_[WieldLocation::TwoHands]};
        slots_[WieldLocation::WeaponHand] = nullptr;
        slots_[WieldLocation::ShieldHand] = nullptr;
        slots_[use_slot] = &item;
        break;
    case WieldLocation::WeaponHand:
    case WieldLocation::ShieldHand:
        displaced = {slots_[WieldLocation::TwoHands], slots_[use_slot]};
        slots_[WieldLocation::TwoHands] = nullptr;
        slots_[use_slot] = &item;
        break;
    case WieldLocation::Body:
    case WieldLocation::Head:
        displaced = {slots_[use_slot]};
        slots_[use_slot] = &item;
        break;
    case WieldLocation::Backpack: displaced = {&item}; break;
    }
    for (auto *obj : displaced) {
        if (obj)
            backpack_.push_back(obj);
    }
}

bool Equipment::remove(const Item &item) {
    bool removed = false;
    for (auto location : WieldFilter::slots()) {
        if (slots_[location] == &item) {
            slots_[location] = nullptr;
            removed = true;
        }
    }
    const auto old_size = backpack_.size();
    backpack_.erase(ranges::remove(backpack_, &item), backpack_.end());
    return removed || backpack_.size() != old_size;
}

Item *Equipment::slot(WieldLocation location) const {
    if (location == WieldLocation::Backpack)
        return nullptr;
    return slots_[location];
}

bool Equipment::is_carrying(const Item &item) const {
    for (auto location : WieldFilter::slots()) {
        if (slots_[location] == &item)
            return true;
    }
    return ranges::find(backpack_, &item) != backpack_.end();
}

const Item &Equipment::weapon() const {
    if (auto *two_handed = slots_[WieldLocation::TwoHands])
        return *two_handed;
    if (auto *one_handed = slots_[WieldLocation::WeaponHand])
        return *one_handed;
    return Item::bare_hands();
}

int Equipment::armor_bonus() const {
    return ranges::accumulate(ArmorSlots, 0, [this](int total, WieldLocation location) {
        const auto *item = slots_[location];
        return item ? total + item->armor() : total;
    });
}

}
