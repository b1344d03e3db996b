/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fray {

class Combatant;

// Combatants a broadcast should skip.
using Exclusions = std::vector<const Combatant *>;
// Names that $You(name) style references in a message template resolve to.
using NameMapping = std::map<std::string, const Combatant *, std::less<>>;

// Where a fight takes place, and how everyone present hears about it.
struct Location {
    virtual ~Location() = default;
    // Sends a message template to everyone present other than the excluded. 'from' is the combatant
    // that $You() refers to, and may be null.
    virtual void broadcast(std::string_view text, const Combatant *from, const Exclusions &exclude,
                           const NameMapping &mapping) = 0;
    [[nodiscard]] virtual bool allows_combat() const = 0;
};

}
