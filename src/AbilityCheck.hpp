/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

namespace fray {

class Combatant;
class Configuration;
class Rng;

// Whether a check is rolled with an extra die, keeping the better or the worse result.
enum class Edge { None, Advantage, Disadvantage };

// Having both advantage and disadvantage cancels out.
[[nodiscard]] Edge combine_edge(bool advantage, bool disadvantage) noexcept;

enum class Quality { Normal, CriticalSuccess, CriticalFailure };

struct CheckResult {
    int natural; // the die as rolled, after choosing between dice for an edge
    int total;
    int target;
    bool success;
    Quality quality;
};

// The value a check against ability must beat, when defender is the one resisting.
[[nodiscard]] int defense_value(const Configuration &config, const Combatant &defender, Ability ability);

// A single roll of the check die plus a bonus, against a target value. Ties go to the target,
// so the total has to exceed it. A natural 1 is a critical failure and the highest face a
// critical success, independently of whether the check succeeded.
class AbilityCheck {
public:
    AbilityCheck(const Configuration &config, const int bonus, const int target, const Edge edge)
        : config_(config), bonus_(bonus), target_(target), edge_(edge) {}

    // attacker's attack_type bonus against defender's defense value for defense_type.
    [[nodiscard]] static AbilityCheck opposed(const Configuration &config, const Combatant &attacker,
                                              const Combatant &defender, Ability attack_type, Ability defense_type,
                                              Edge edge);

    [[nodiscard]] CheckResult roll(Rng &rng) const;

private:
    [[nodiscard]] int roll_natural(Rng &rng) const;

    const Configuration &config_;
    const int bonus_;
    const int target_;
    const Edge edge_;
};

}
