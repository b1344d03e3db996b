/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "CombatHandler.hpp"
#include "ActionResolver.hpp"
#include "Combatant.hpp"
#include "Equipment.hpp"
#include "common/Configuration.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <utility>

namespace fray {

namespace {

// Health at or below zero means down, so every band above the last is still standing.
std::string_view wound_for(int percent) {
    if (percent >= 100)
        return "is unhurt.";
    if (percent >= 80)
        return "is bruised but steady.";
    if (percent >= 60)
        return "is bleeding from a few cuts.";
    if (percent >= 40)
        return "is badly wounded.";
    if (percent >= 20)
        return "is |ystaggering|w.";
    if (percent > 0)
        return "is |rbarely standing|w.";
    return "is |Rdown|w.";
}

std::string describe_condition(const Combatant &combatant) {
    const auto percent = combatant.hp_max() > 0 ? combatant.hp() * 100 / combatant.hp_max() : 0;
    return fmt::format("{} {}", upper_first_character(combatant.name()), wound_for(percent));
}

std::string references(const std::vector<const Combatant *> &combatants) {
    return list_to_string(combatants
                          | ranges::views::transform([](const auto *c) { return fmt::format("$You({})", c->name()); })
                          | ranges::to<std::vector<std::string>>);
}

}

CombatHandler::CombatHandler(HandlerId id, Location &location, Dependencies &dependencies)
    : id_(id), location_(location), dependencies_(dependencies), flee_timeout_(dependencies.config().flee_timeout()) {}

Rng &CombatHandler::rng() const { return dependencies_.rng(); }
Logger &CombatHandler::logger() const { return dependencies_.logger(); }
const Configuration &CombatHandler::config() const { return dependencies_.config(); }

void CombatHandler::check_running(std::string_view what) const {
    if (is_stopped())
        throw CombatStopped(fmt::format("Combat has already stopped, unable to {}", what));
}

const CombatHandler::Engagement &CombatHandler::engagement_of(const Combatant &combatant) const {
    auto it = ranges::find_if(combatants_, [&combatant](const auto &e) { return e.combatant == &combatant; });
    if (it == combatants_.end())
        throw NotInCombat(fmt::format("{} is not fighting in combat {}", combatant.name(), id_.value_or(0)));
    return *it;
}

CombatHandler::Engagement &CombatHandler::engagement_of(const Combatant &combatant) {
    return const_cast<Engagement &>(std::as_const(*this).engagement_of(combatant));
}

bool CombatHandler::is_engaged(const Combatant &combatant) const {
    return ranges::find_if(combatants_, [&combatant](const auto &e) { return e.combatant == &combatant; })
           != combatants_.end();
}

const std::optional<Action> &CombatHandler::queued_action(const Combatant &combatant) const {
    return engagement_of(combatant).queued;
}

const Combatant *CombatHandler::holder_of(const Item &item) const {
    auto it = ranges::find_if(combatants_, [&item](const auto &e) { return e.combatant->equipment().is_carrying(item); });
    return it == combatants_.end() ? nullptr : it->combatant;
}

bool CombatHandler::is_fleeing(const Combatant &combatant) const { return fleeing_.contains(&combatant); }

void CombatHandler::add_combatant(Combatant &combatant) {
    check_running("add a combatant");
    if (is_engaged(combatant))
        return;
    if (auto *other = dependencies_.handler_for(combatant); other && other != this) {
        logger().warn("{} is already fighting in combat {}, not adding them to combat {}", combatant.name(),
                      other->id().value_or(0), *id_);
        return;
    }
    if (auto it = ranges::find(defeated_, &combatant); it != defeated_.end()) {
        logger().debug("Combat {}: {} rejoins the fight", *id_, combatant.name());
        defeated_.erase(it);
    }
    combatants_.push_back(Engagement{&combatant, std::nullopt});
    dependencies_.engage(combatant, *this);
    logger().debug("Combat {}: {} joins the fight", *id_, combatant.name());
}

void CombatHandler::add_combatants(const std::vector<Combatant *> &combatants) {
    for (auto *combatant : combatants)
        add_combatant(*combatant);
}

void CombatHandler::remove_combatant(const Combatant &combatant) {
    auto it = ranges::find_if(combatants_, [&combatant](const auto &e) { return e.combatant == &combatant; });
    if (it == combatants_.end())
        return;
    combatants_.erase(it);
    advantage_.purge(combatant);
    disadvantage_.purge(combatant);
    fleeing_.erase(&combatant);
    dependencies_.disengage(combatant);
    logger().debug("Combat {}: {} leaves the fight", id_.value_or(0), combatant.name());
}

CombatHandler::Sides CombatHandler::get_sides(const Combatant &combatant) const {
    check_running("work out sides");
    const auto &self = engagement_of(combatant);
    Sides sides;
    for (const auto &e : combatants_) {
        if (&e == &self)
            continue;
        if (combatant.is_hostile_to(*e.combatant))
            sides.enemies.push_back(e.combatant);
        else
            sides.allies.push_back(e.combatant);
    }
    return sides;
}

void CombatHandler::stop_combat() {
    if (is_stopped())
        return;
    logger().info("Combat {} stopped after {} turns", *id_, turn_);
    for (const auto &e : combatants_)
        dependencies_.disengage(*e.combatant);
    combatants_.clear();
    advantage_.clear();
    disadvantage_.clear();
    fleeing_.clear();
    defeated_.clear();
    id_.reset();
}

NameMapping CombatHandler::name_mapping() const {
    NameMapping mapping;
    for (const auto &e : combatants_)
        mapping.emplace(std::string(e.combatant->name()), e.combatant);
    return mapping;
}

void CombatHandler::msg(std::string_view text, const Combatant *from, const Exclusions &exclude) const {
    location_.broadcast(text, from, exclude, name_mapping());
}

void CombatHandler::queue_action(const Combatant &combatant, Action action) {
    check_running("queue an action");
    auto &engagement = engagement_of(combatant);
    logger().debug("Combat {}: {} declares {}", *id_, combatant.name(), to_string(key_of(action)));
    engagement.queued = std::move(action);
}

void CombatHandler::execute_next_action(Combatant &combatant) {
    check_running("execute an action");
    auto &engagement = engagement_of(combatant);
    const auto action = std::exchange(engagement.queued, std::nullopt).value_or(actions::DoNothing{});
    if (combatant.is_down()) {
        logger().debug("Combat {}: {} is down and can't {}", *id_, combatant.name(), to_string(key_of(action)));
        return;
    }
    auto resolver = make_resolver(*this, combatant, action);
    try {
        resolver->execute();
    } catch (const std::exception &e) {
        logger().error("Combat {}: {} failed to {}: {}", id_.value_or(0), combatant.name(), to_string(key_of(action)),
                       e.what());
        msg("$You() $conj(falter), losing the moment.", &combatant);
    }
}

void CombatHandler::execute_full_turn() {
    check_running("execute a turn");
    const auto order = combatants_ | ranges::views::transform(&Engagement::combatant) | ranges::to<std::vector>;
    logger().debug("Combat {}: turn {} begins with {} combatants", *id_, turn_ + 1, order.size());
    for (auto *combatant : order) {
        // An earlier action in this turn may have seen them off already.
        if (is_engaged(*combatant))
            execute_next_action(*combatant);
    }
    ++turn_;
    remove_defeated();
    remove_escaped();
    if (is_over()) {
        announce_result();
        stop_combat();
    }
}

void CombatHandler::remove_defeated() {
    const auto down = combatants_ | ranges::views::transform(&Engagement::combatant)
                      | ranges::views::filter([](const auto *c) { return c->is_down(); }) | ranges::to<std::vector>;
    for (auto *combatant : down) {
        combatant->at_defeat();
        msg("|r$You() $conj(fall) to the ground, defeated.|w", combatant);
        defeated_.push_back(combatant);
        remove_combatant(*combatant);
    }
}

void CombatHandler::remove_escaped() {
    const auto escaped = combatants_ | ranges::views::transform(&Engagement::combatant)
                         | ranges::views::filter([this](const auto *c) {
                               const auto it = fleeing_.find(c);
                               return it != fleeing_.end() && turn_ - it->second > flee_timeout_;
                           })
                         | ranges::to<std::vector>;
    for (auto *combatant : escaped) {
        msg("|y$You() successfully $conj(flee) from combat.|w", combatant);
        defeated_.push_back(combatant);
        remove_combatant(*combatant);
    }
}

bool CombatHandler::is_over() const {
    if (combatants_.empty())
        return true;
    return get_sides(*combatants_.front().combatant).enemies.empty();
}

void CombatHandler::announce_result() const {
    auto mapping = name_mapping();
    for (const auto *c : defeated_)
        mapping.emplace(std::string(c->name()), c);
    const auto standing = combatants_ | ranges::views::transform([](const auto &e) -> const Combatant * {
                              return e.combatant;
                          })
                          | ranges::to<std::vector>;
    std::string text;
    if (standing.empty())
        text = "The combat is over. No-one stands as the victor.";
    else
        text = fmt::format("The combat is over. {} {} still standing.", references(standing),
                           standing.size() == 1 ? "$conj(are)" : "are");
    const auto fallen = defeated_ | ranges::views::filter([](const auto *c) { return c->is_down(); })
                        | ranges::to<std::vector>;
    const auto fled = defeated_ | ranges::views::filter([](const auto *c) { return !c->is_down(); })
                      | ranges::to<std::vector>;
    if (!fallen.empty())
        text += fmt::format(" {} fell in battle.", references(fallen));
    if (!fled.empty())
        text += fmt::format(" {} fled the fight.", references(fled));
    logger().info("Combat {} is over after {} turns", id_.value_or(0), turn_);
    location_.broadcast(text, standing.size() == 1 ? standing.front() : nullptr, {}, mapping);
}

void CombatHandler::flee(const Combatant &combatant) { fleeing_.try_emplace(&combatant, turn_); }

void CombatHandler::unflee(const Combatant &combatant) { fleeing_.erase(&combatant); }

std::string CombatHandler::combat_summary(const Combatant &viewer) const {
    const auto sides = get_sides(viewer);
    auto fleeing_tag = [this](const Combatant &c) { return is_fleeing(c) ? " (fleeing)" : ""; };
    std::string result = fmt::format("Turn {}\n", turn_ + 1);
    result += fmt::format("  You ({} / {} health){}\n", viewer.hp(), viewer.hp_max(), fleeing_tag(viewer));
    for (const auto *ally : sides.allies)
        result += fmt::format("  {} ({} / {} health){}\n", ally->name(), ally->hp(), ally->hp_max(), fleeing_tag(*ally));
    result += "versus\n";
    for (const auto *enemy : sides.enemies)
        result += fmt::format("  {}{}\n", describe_condition(*enemy), fleeing_tag(*enemy));
    return result;
}

}
