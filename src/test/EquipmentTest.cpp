/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Equipment.hpp"
#include "Item.hpp"

#include <catch2/catch.hpp>

#include <vector>

using namespace fray;

TEST_CASE("equipment") {
    Equipment equipment;
    Item sword{"a sword", WieldLocation::WeaponHand};
    Item axe{"an axe", WieldLocation::WeaponHand};
    Item shield{"a shield", WieldLocation::ShieldHand, WeaponProfile{}, 2};
    Item staff{"a staff", WieldLocation::TwoHands};
    Item helm{"a helm", WieldLocation::Head, WeaponProfile{}, 1};
    Item coat{"a coat", WieldLocation::Body, WeaponProfile{}, 1};
    Item hat{"a hat", WieldLocation::Head};
    Item rope{"a rope", WieldLocation::Backpack};

    SECTION("empty handed") {
        CHECK(&equipment.weapon() == &Item::bare_hands());
        CHECK(equipment.weapon().name() == "Empty Fists");
        CHECK(equipment.armor_bonus() == 0);
        CHECK(equipment.backpack().empty());
    }
    SECTION("a one handed weapon takes the weapon hand") {
        equipment.move(sword);
        CHECK(equipment.slot(WieldLocation::WeaponHand) == &sword);
        CHECK(&equipment.weapon() == &sword);
        SECTION("and another replaces it") {
            equipment.move(axe);
            CHECK(equipment.slot(WieldLocation::WeaponHand) == &axe);
            CHECK(equipment.backpack() == std::vector<Item *>{&sword});
        }
        SECTION("and moving it again changes nothing") {
            equipment.move(sword);
            CHECK(equipment.slot(WieldLocation::WeaponHand) == &sword);
            CHECK(equipment.backpack().empty());
        }
    }
    SECTION("a two handed weapon clears both hands") {
        equipment.move(sword);
        equipment.move(shield);
        equipment.move(staff);
        CHECK(equipment.slot(WieldLocation::TwoHands) == &staff);
        CHECK(equipment.slot(WieldLocation::WeaponHand) == nullptr);
        CHECK(equipment.slot(WieldLocation::ShieldHand) == nullptr);
        CHECK(equipment.backpack() == std::vector<Item *>{&sword, &shield});
        CHECK(&equipment.weapon() == &staff);
        SECTION("and a shield clears the two handed weapon") {
            equipment.move(shield);
            CHECK(equipment.slot(WieldLocation::TwoHands) == nullptr);
            CHECK(equipment.slot(WieldLocation::ShieldHand) == &shield);
            CHECK(equipment.backpack() == std::vector<Item *>{&sword, &staff});
            CHECK(&equipment.weapon() == &Item::bare_hands());
        }
    }
    SECTION("worn items give armor") {
        equipment.move(shield);
        equipment.move(helm);
        equipment.move(coat);
        CHECK(equipment.armor_bonus() == 4);
        equipment.move(hat);
        CHECK(equipment.armor_bonus() == 3);
        CHECK(equipment.backpack() == std::vector<Item *>{&helm});
    }
    SECTION("backpack items are carried") {
        equipment.move(rope);
        CHECK(equipment.is_carrying(rope));
        CHECK(equipment.backpack() == std::vector<Item *>{&rope});
        equipment.move(rope);
        CHECK(equipment.backpack().size() == 1);
    }
    SECTION("removing") {
        equipment.move(sword);
        equipment.move(rope);
        CHECK(equipment.remove(sword));
        CHECK(equipment.remove(rope));
        CHECK(!equipment.remove(rope));
        CHECK(!equipment.is_carrying(sword));
        CHECK(equipment.slot(WieldLocation::WeaponHand) == nullptr);
    }
}
