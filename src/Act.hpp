/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Location.hpp"
#include "Logging.hpp"

#include <string>
#include <string_view>

namespace fray {

class Combatant;

// Renders a message template as it should read for one recipient. The template codes are:
//   $You() $you()          the 'from' combatant: "You" to themselves, their name to everyone else
//   $You(key) $you(key)    the combatant mapped to key, in the same way
//   $Your() $your(key)     possessives: "your" or "Name's"
//   $conj(verb)            the verb as-is for 'from', conjugated for everyone else ("hit" -> "hits")
//   $$                     a literal dollar
// Bad codes and unknown keys are reported to the logger and rendered as best we can. The first
// letter of the result is always upper-cased.
[[nodiscard]] std::string format_act(std::string_view format, const Combatant &to, const Combatant *from,
                                     const NameMapping &mapping, Logger &logger);

}
