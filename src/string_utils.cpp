/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "string_utils.hpp"

#include <fmt/format.h>
#include <gsl/gsl_util>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/view/zip.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

using namespace std::literals;

namespace fray {

namespace {

constexpr std::array Vowels{'a', 'e', 'i', 'o', 'u'};

bool is_vowel(char c) {
    return std::find(Vowels.begin(), Vowels.end(), std::tolower(static_cast<unsigned char>(c))) != Vowels.end();
}

bool ends_with(std::string_view sv, std::string_view suffix) {
    return sv.size() >= suffix.size() && sv.substr(sv.size() - suffix.size()) == suffix;
}

}

std::string upper_first_character(std::string_view sv) {
    std::string result(sv);
    // Uppercase the first non-colour-sequence letter.
    bool skip_next{false};
    for (auto &c : result) {
        if (std::exchange(skip_next, false))
            continue;
        if (c == '|')
            skip_next = true;
        else {
            c = gsl::narrow_cast<char>(toupper(c));
            break;
        }
    }
    return result;
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs),
                          [](auto pr) { return tolower(pr.first) == tolower(pr.second); });
}

bool matches_start(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() > rhs.size() || lhs.empty())
        return false;
    return matches(lhs, rhs.substr(0, lhs.size()));
}

std::string list_to_string(const std::vector<std::string> &words) {
    switch (words.size()) {
    case 0: return "";
    case 1: return words.front();
    default: break;
    }
    std::string result;
    for (auto i = 0u; i + 1 < words.size(); ++i) {
        if (i > 0)
            result += ", ";
        result += words[i];
    }
    return fmt::format("{} and {}", result, words.back());
}

std::string third_person(std::string_view verb) {
    if (verb.empty())
        return "";
    if (verb == "are"sv)
        return "is";
    if (verb == "have"sv)
        return "has";
    if (ends_with(verb, "s") || ends_with(verb, "sh") || ends_with(verb, "ch") || ends_with(verb, "x")
        || ends_with(verb, "z") || (ends_with(verb, "o") && verb.size() > 1 && !is_vowel(verb[verb.size() - 2])))
        return fmt::format("{}es", verb);
    if (ends_with(verb, "y") && verb.size() > 1 && !is_vowel(verb[verb.size() - 2]))
        return fmt::format("{}ies", verb.substr(0, verb.size() - 1));
    return fmt::format("{}s", verb);
}

}
