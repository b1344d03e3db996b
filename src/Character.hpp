/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Ability.hpp"
#include "Combatant.hpp"
#include "Equipment.hpp"
#include "PerEnum.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fray {

// A straightforward combatant: players and mobs, who are hostile to each other and to nobody else.
// Everything sent to a character is kept in order, for whoever's showing it to a player.
class Character : public Combatant {
public:
    enum class Kind { Player, Mob };

    static constexpr int DefaultHp = 4;
    static constexpr int DefaultAbilityBonus = 1;
    static constexpr int DefaultArmor = 11;

    Character(std::string name, Kind kind, int hp = DefaultHp);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] int hp() const override { return hp_; }
    void hp(int hp) override { hp_ = hp; }
    [[nodiscard]] int hp_max() const override { return hp_max_; }
    void hp_max(int hp_max) { hp_max_ = hp_max; }

    [[nodiscard]] int ability_bonus(Ability ability) const override;
    void ability_bonus(Ability ability, int bonus);
    // Base armor plus whatever is worn.
    [[nodiscard]] int armor() const override;
    void base_armor(int armor) noexcept { base_armor_ = armor; }

    [[nodiscard]] Equipment &equipment() override { return equipment_; }
    [[nodiscard]] const Equipment &equipment() const override { return equipment_; }

    [[nodiscard]] bool is_hostile_to(const Combatant &other) const override;

    [[nodiscard]] Location *location() const override { return location_; }
    void location(Location *location) noexcept { location_ = location; }

    void send_to(std::string_view text) override;
    [[nodiscard]] const std::vector<std::string> &output() const noexcept { return output_; }
    void clear_output() { output_.clear(); }

    void at_defeat() override;
    [[nodiscard]] int times_defeated() const noexcept { return times_defeated_; }

private:
    std::string name_;
    Kind kind_;
    int hp_;
    int hp_max_;
    PerEnum<Ability, int> abilities_;
    int base_armor_{DefaultArmor};
    Equipment equipment_;
    Location *location_{};
    std::vector<std::string> output_;
    int times_defeated_{};
};

}
