/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Ability.hpp"
#include "string_utils.hpp"

#include <magic_enum.hpp>

using namespace std::literals;

namespace fray {

std::string_view to_short_string(Ability ability) {
    switch (ability) {
    case Ability::Str: return "str"sv;
    case Ability::Dex: return "dex"sv;
    case Ability::Con: return "con"sv;
    case Ability::Int: return "int"sv;
    case Ability::Wis: return "wis"sv;
    case Ability::Cha: return "cha"sv;
    case Ability::Armor: return "armor"sv;
    }
    return "(unknown)"sv;
}

std::string_view to_long_string(Ability ability) {
    switch (ability) {
    case Ability::Str: return "strength"sv;
    case Ability::Dex: return "dexterity"sv;
    case Ability::Con: return "constitution"sv;
    case Ability::Int: return "intelligence"sv;
    case Ability::Wis: return "wisdom"sv;
    case Ability::Cha: return "charisma"sv;
    case Ability::Armor: return "armor"sv;
    }
    return "(unknown)"sv;
}

std::optional<Ability> try_parse_ability(std::string_view name) {
    for (auto ability : magic_enum::enum_values<Ability>()) {
        if (matches(name, to_short_string(ability)) || matches(name, to_long_string(ability)))
            return ability;
    }
    return std::nullopt;
}

}
