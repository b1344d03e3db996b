/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Dice.hpp"

#include <charconv>
#include <tuple>

namespace fray {

namespace {

std::optional<int> parse_positive(std::string_view text) {
    int value{};
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value <= 0)
        return std::nullopt;
    return value;
}

}

std::optional<Dice> Dice::from_string(std::string_view text) {
    const auto d_pos = text.find_first_of("dD");
    if (d_pos == std::string_view::npos)
        return std::nullopt;
    const auto number = parse_positive(text.substr(0, d_pos));
    auto rest = text.substr(d_pos + 1);
    auto sign_pos = rest.find_first_of("+-");
    const auto type = parse_positive(rest.substr(0, sign_pos));
    if (!number || !type)
        return std::nullopt;
    if (sign_pos == std::string_view::npos)
        return Dice(*number, *type);
    const auto bonus = parse_positive(rest.substr(sign_pos + 1));
    if (!bonus)
        return std::nullopt;
    return Dice(*number, *type, rest[sign_pos] == '-' ? -*bonus : *bonus);
}

bool Dice::operator==(const Dice &rhs) const {
    return std::tie(number_, type_, bonus_) == std::tie(rhs.number_, rhs.type_, rhs.bonus_);
}

bool Dice::operator!=(const Dice &rhs) const { return !(rhs == *this); }

}
