/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Rng.hpp"

#include <fmt/format.h>

#include <optional>
#include <string_view>

namespace fray {

// A roll of the form NdS+B, e.g. the damage a weapon deals or the amount a potion heals.
class Dice {
    int number_{};
    int type_{};
    int bonus_{};

public:
    Dice() = default;
    explicit Dice(int number, int type, int bonus = 0) : number_(number), type_(type), bonus_(bonus) {}

    // Parses "1d6", "2D4+1" or "1d8-1". Returns nullopt if the text isn't a well formed dice expression.
    [[nodiscard]] static std::optional<Dice> from_string(std::string_view text);

    [[nodiscard]] int number() const noexcept { return number_; }
    [[nodiscard]] int type() const noexcept { return type_; }
    [[nodiscard]] int bonus() const noexcept { return bonus_; }

    [[nodiscard]] int roll(Rng &rng) const noexcept { return rng.dice(number_, type_) + bonus_; }

    bool operator==(const Dice &rhs) const;
    bool operator!=(const Dice &rhs) const;
};

}

template <>
struct fmt::formatter<fray::Dice> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
    template <typename FormatContext>
    auto format(const fray::Dice &dice, FormatContext &ctx) const {
        if (dice.bonus() > 0)
            return fmt::format_to(ctx.out(), "{}d{}+{}", dice.number(), dice.type(), dice.bonus());
        else if (dice.bonus() < 0)
            return fmt::format_to(ctx.out(), "{}d{}{}", dice.number(), dice.type(), dice.bonus());
        else
            return fmt::format_to(ctx.out(), "{}d{}", dice.number(), dice.type());
    }
};
