/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "AdvantageMatrix.hpp"

#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/map.hpp>

namespace fray {

void AdvantageMatrix::give(const Combatant &holder, const Combatant &target) { flags_[&holder].insert(&target); }

bool AdvantageMatrix::has(const Combatant &holder, const Combatant &target) const {
    const auto it = flags_.find(&holder);
    return it != flags_.end() && it->second.contains(&target);
}

bool AdvantageMatrix::lose(const Combatant &holder, const Combatant &target) {
    const auto it = flags_.find(&holder);
    if (it == flags_.end())
        return false;
    const auto erased = it->second.erase(&target) > 0;
    if (it->second.empty())
        flags_.erase(it);
    return erased;
}

std::vector<const Combatant *> AdvantageMatrix::targets_of(const Combatant &holder) const {
    const auto it = flags_.find(&holder);
    if (it == flags_.end())
        return {};
    return {it->second.begin(), it->second.end()};
}

void AdvantageMatrix::purge(const Combatant &combatant) {
    flags_.erase(&combatant);
    for (auto it = flags_.begin(); it != flags_.end();) {
        it->second.erase(&combatant);
        if (it->second.empty())
            it = flags_.erase(it);
        else
            ++it;
    }
}

size_t AdvantageMatrix::size() const noexcept {
    return ranges::accumulate(flags_ | ranges::views::values, size_t{0},
                              [](size_t total, const auto &targets) { return total + targets.size(); });
}

}
