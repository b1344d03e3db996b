/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Character.hpp"
#include "CombatHandler.hpp"
#include "CombatRegistry.hpp"
#include "Item.hpp"
#include "Logging.hpp"
#include "Rng.hpp"
#include "Room.hpp"
#include "common/Configuration.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <vector>

// fray-skirmish - runs a fight between a party of players and a band of mobs in a single room,
// with every combatant following a simple policy, and prints the fight as the first player sees it.
// Useful for eyeballing balance changes made through the FRAY_ environment variables.

template <>
struct fmt::formatter<lyra::cli> : ostream_formatter {};

using namespace fray;

namespace {

struct Armoury {
    Item sword{"a short sword", WieldLocation::WeaponHand, WeaponProfile{Ability::Str, Ability::Armor, Dice{1, 6}}};
    Item axe{"a great axe", WieldLocation::TwoHands, WeaponProfile{Ability::Str, Ability::Armor, Dice{1, 10}}};
    Item dagger{"a rusty dagger", WieldLocation::WeaponHand, WeaponProfile{Ability::Dex, Ability::Armor, Dice{1, 4}}};
    Item shield{"a round shield", WieldLocation::ShieldHand, WeaponProfile{}, 1};
    std::vector<std::unique_ptr<Consumable>> potions;
};

Combatant *first_standing(const std::vector<Combatant *> &combatants) {
    auto it = ranges::find_if(combatants, [](const auto *c) { return !c->is_down(); });
    return it == combatants.end() ? nullptr : *it;
}

Item *potion_of(Character &character) {
    for (auto *item : character.equipment().backpack()) {
        if (item->is_usable() && dynamic_cast<Consumable *>(item))
            return item;
    }
    return nullptr;
}

// What a combatant does this turn. Players stop fleeing enemies, drink when hurt and otherwise
// alternate between feints and blows. Mobs run when badly hurt.
Action choose_action(CombatHandler &handler, Character &character, Rng &rng) {
    const auto sides = handler.get_sides(character);
    auto *enemy = first_standing(sides.enemies);
    if (!enemy)
        return actions::DoNothing{};
    const auto hurt = character.hp() * 2 < character.hp_max();
    if (character.kind() == Character::Kind::Mob) {
        if (hurt || handler.is_fleeing(character))
            return actions::Flee{};
        return actions::Attack{enemy};
    }
    for (auto *other : sides.enemies) {
        if (handler.is_fleeing(*other))
            return actions::Hinder{other};
    }
    if (hurt) {
        if (auto *potion = potion_of(character))
            return actions::UseItem{potion, &character};
    }
    if (!handler.advantage_matrix().has(character, *enemy) && rng.number_range(1, 3) == 1)
        return actions::Stunt{&character, enemy, true, Ability::Dex, Ability::Wis};
    return actions::Attack{enemy};
}

}

int main(int argc, const char **argv) {
    bool help{};
    bool verbose{};
    unsigned int seed{1};
    int num_players{2};
    int num_mobs{3};
    int max_turns{50};
    auto cli = lyra::cli() | lyra::help(help).description("Run a skirmish between players and mobs")
               | lyra::opt(seed, "seed")["--seed"]("random seed")
               | lyra::opt(num_players, "players")["--players"]("number of players")
               | lyra::opt(num_mobs, "mobs")["--mobs"]("number of mobs")
               | lyra::opt(max_turns, "turns")["--max-turns"]("give up after this many turns")
               | lyra::opt(verbose)["-V"]("verbose logging");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.message());
        exit(1);
    } else if (help) {
        fmt::print("{}", cli);
        exit(0);
    }
    if (num_players < 1 || num_mobs < 1 || max_turns < 1) {
        fmt::print("There must be at least one player, one mob and one turn\n");
        exit(1);
    }

    std::unique_ptr<Configuration> config;
    try {
        config = std::make_unique<Configuration>();
    } catch (const std::invalid_argument &e) {
        fmt::print("Bad configuration: {}\n", e.what());
        exit(1);
    }
    set_log_level(verbose ? spdlog::level::debug : config->log_level());
    auto logger = logger_for("skirmish");

    SeededRng rng(seed);
    Armoury armoury;
    Room arena("the arena", logger);
    std::vector<std::unique_ptr<Character>> characters;
    for (auto i = 0; i < num_players; ++i) {
        auto &player = *characters.emplace_back(
            std::make_unique<Character>(fmt::format("Hero{}", i + 1), Character::Kind::Player, 8));
        player.ability_bonus(Ability::Dex, 2);
        auto &potion =
            *armoury.potions.emplace_back(std::make_unique<Consumable>("a healing draught", Dice{1, 4, 1}, 1));
        player.equipment().move(potion);
        arena.enter(player);
    }
    for (auto i = 0; i < num_mobs; ++i) {
        auto &mob = *characters.emplace_back(
            std::make_unique<Character>(fmt::format("Goblin{}", i + 1), Character::Kind::Mob, 5));
        mob.ability_bonus(Ability::Str, 0);
        arena.enter(mob);
    }
    // Share the gear around: the first player gets a sword and shield, the rest an axe, mobs a dagger.
    characters.front()->equipment().move(armoury.sword);
    characters.front()->equipment().move(armoury.shield);
    if (num_players > 1)
        characters[1]->equipment().move(armoury.axe);
    characters.back()->equipment().move(armoury.dagger);

    CombatRegistry registry(rng, logger, *config);
    auto &viewer = *characters.front();
    auto &handler = registry.get_or_create(viewer);
    for (const auto &character : characters)
        handler.add_combatant(*character);

    while (!handler.is_stopped() && handler.turn() < max_turns) {
        if (handler.is_engaged(viewer))
            fmt::print("{}", handler.combat_summary(viewer));
        for (const auto &character : characters) {
            if (handler.is_engaged(*character))
                handler.queue_action(*character, choose_action(handler, *character, rng));
        }
        viewer.clear_output();
        handler.execute_full_turn();
        for (const auto &line : viewer.output())
            fmt::print("{}\n", line);
    }
    if (!handler.is_stopped()) {
        logger.warn("No result after {} turns, calling it a draw", max_turns);
        handler.stop_combat();
    }
    registry.collect_garbage();
}
