/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "AbilityCheck.hpp"
#include "Combatant.hpp"
#include "Rng.hpp"
#include "common/Configuration.hpp"

#include <algorithm>

namespace fray {

Edge combine_edge(bool advantage, bool disadvantage) noexcept {
    if (advantage == disadvantage)
        return Edge::None;
    return advantage ? Edge::Advantage : Edge::Disadvantage;
}

int defense_value(const Configuration &config, const Combatant &defender, Ability ability) {
    if (ability == Ability::Armor)
        return defender.armor();
    return defender.ability_bonus(ability) + config.defense_base();
}

AbilityCheck AbilityCheck::opposed(const Configuration &config, const Combatant &attacker, const Combatant &defender,
                                   Ability attack_type, Ability defense_type, Edge edge) {
    return AbilityCheck(config, attacker.ability_bonus(attack_type), defense_value(config, defender, defense_type),
                        edge);
}

int AbilityCheck::roll_natural(Rng &rng) const {
    const auto die_size = config_.die_size();
    const auto first = rng.number_range(1, die_size);
    switch (edge_) {
    case Edge::None: break;
    case Edge::Advantage: return std::max(first, rng.number_range(1, die_size));
    case Edge::Disadvantage: return std::min(first, rng.number_range(1, die_size));
    }
    return first;
}

CheckResult AbilityCheck::roll(Rng &rng) const {
    const auto natural = roll_natural(rng);
    const auto total = natural + bonus_;
    auto quality = Quality::Normal;
    if (natural <= 1)
        quality = Quality::CriticalFailure;
    else if (natural >= config_.die_size())
        quality = Quality::CriticalSuccess;
    return CheckResult{
        .natural = natural, .total = total, .target = target_, .success = total > target_, .quality = quality};
}

}
