/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatRegistry.hpp"
#include "Combatant.hpp"

#include <fmt/format.h>

namespace fray {

CombatHandler &CombatRegistry::get_or_create(Combatant &combatant) {
    if (auto *handler = handler_for(combatant))
        return *handler;
    auto *location = combatant.location();
    if (!location)
        throw CombatNotAllowed(fmt::format("{} is nowhere, and can't start a fight there", combatant.name()));
    if (!location->allows_combat())
        throw CombatNotAllowed(fmt::format("Fighting isn't allowed where {} is", combatant.name()));
    auto &handler = *handlers_.emplace_back(std::make_unique<CombatHandler>(next_id_++, *location, *this));
    logger_.info("Combat {} started by {}", *handler.id(), combatant.name());
    handler.add_combatant(combatant);
    return handler;
}

CombatHandler &CombatRegistry::join_combat(Combatant &combatant, Combatant &target) {
    auto *mine = handler_for(combatant);
    auto *theirs = handler_for(target);
    if (mine && theirs && mine != theirs)
        throw CombatNotAllowed(fmt::format("{} and {} are already fighting in different combats", combatant.name(),
                                           target.name()));
    auto &handler = mine ? *mine : theirs ? *theirs : get_or_create(combatant);
    handler.add_combatants({&combatant, &target});
    return handler;
}

size_t CombatRegistry::collect_garbage() {
    return std::erase_if(handlers_, [](const auto &handler) { return handler->is_stopped(); });
}

CombatHandler *CombatRegistry::handler_for(const Combatant &combatant) const {
    if (auto it = engaged_.find(&combatant); it != engaged_.end())
        return it->second;
    return nullptr;
}

void CombatRegistry::engage(Combatant &combatant, CombatHandler &handler) { engaged_[&combatant] = &handler; }

void CombatRegistry::disengage(const Combatant &combatant) { engaged_.erase(&combatant); }

}
