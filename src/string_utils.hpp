/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fray {

// Upper-cases the first character, taking into account colour codes like `|Rthe goblin falls!`
[[nodiscard]] std::string upper_first_character(std::string_view sv);

// Compares two strings: are they referring to the same thing. That currently means "case insensitive comparison".
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Similar to matches() but checks if rhs starts with lhs, case insensitively.
// lhs must be at least one character long and must not be longer than rhs.
[[nodiscard]] bool matches_start(std::string_view lhs, std::string_view rhs);

// Joins words into an English list: "a", "a and b", "a, b and c".
[[nodiscard]] std::string list_to_string(const std::vector<std::string> &words);

// Third person singular form of a verb in the present tense, e.g. "hit" -> "hits", "dodge" -> "dodges",
// "parry" -> "parries", "lunge" -> "lunges".
[[nodiscard]] std::string third_person(std::string_view verb);

}
