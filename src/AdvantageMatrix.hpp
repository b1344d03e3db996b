/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fray {

class Combatant;

// One-shot flags on ordered pairs of combatants: "holder has an edge against target on their next
// contested roll". A flag is set by a successful stunt and consumed by the first roll between the
// same pair; a flag for (a, b) says nothing about (b, a) or any other pair.
class AdvantageMatrix {
public:
    void give(const Combatant &holder, const Combatant &target);
    [[nodiscard]] bool has(const Combatant &holder, const Combatant &target) const;
    // Clears the flag. Returns whether it was set.
    bool lose(const Combatant &holder, const Combatant &target);
    // Checks and clears in one go. This is the only way a roll should use the flag.
    bool consume(const Combatant &holder, const Combatant &target) { return lose(holder, target); }

    // Everyone holder currently has a flag against, in no particular order.
    [[nodiscard]] std::vector<const Combatant *> targets_of(const Combatant &holder) const;
    // Drops every flag held by, or held against, the combatant.
    void purge(const Combatant &combatant);
    void clear() { flags_.clear(); }
    [[nodiscard]] bool empty() const noexcept { return flags_.empty(); }
    [[nodiscard]] size_t size() const noexcept;

private:
    std::unordered_map<const Combatant *, std::unordered_set<const Combatant *>> flags_;
};

}
