/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <optional>
#include <string_view>

namespace fray {

// The abilities a check can be rolled against. Armor is not a real ability: it only ever
// appears on the defending side of a check, where it stands for the defender's armor rating.
enum class Ability { Str, Dex, Con, Int, Wis, Cha, Armor };

[[nodiscard]] std::string_view to_short_string(Ability ability);
[[nodiscard]] std::string_view to_long_string(Ability ability);

// Case insensitive match against either the short or long name.
[[nodiscard]] std::optional<Ability> try_parse_ability(std::string_view name);

}
