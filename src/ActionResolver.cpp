/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "ActionResolver.hpp"
#include "CombatHandler.hpp"
#include "Combatant.hpp"
#include "Equipment.hpp"
#include "Item.hpp"
#include "Rng.hpp"
#include "Visitor.hpp"
#include "common/Configuration.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace fray {

namespace {

// Message templates refer to combatants other than the actor by name.
std::string you(const Combatant &combatant) { return fmt::format("$you({})", combatant.name()); }
std::string your(const Combatant &combatant) { return fmt::format("$your({})", combatant.name()); }

}

void ActionResolver::give_advantage(const Combatant &recipient, const Combatant &target) {
    handler_.advantage_matrix().give(recipient, target);
}

void ActionResolver::give_disadvantage(const Combatant &recipient, const Combatant &target) {
    handler_.disadvantage_matrix().give(recipient, target);
}

bool ActionResolver::has_advantage(const Combatant &recipient, const Combatant &target) const {
    return handler_.advantage_matrix().has(recipient, target);
}

bool ActionResolver::has_disadvantage(const Combatant &recipient, const Combatant &target) const {
    return handler_.disadvantage_matrix().has(recipient, target);
}

bool ActionResolver::lose_advantage(const Combatant &recipient, const Combatant &target) {
    return handler_.advantage_matrix().lose(recipient, target);
}

bool ActionResolver::lose_disadvantage(const Combatant &recipient, const Combatant &target) {
    return handler_.disadvantage_matrix().lose(recipient, target);
}

void ActionResolver::flee(const Combatant &combatant) { handler_.flee(combatant); }

void ActionResolver::unflee(const Combatant &combatant) { handler_.unflee(combatant); }

void ActionResolver::msg(std::string_view text) const { handler_.msg(text, &actor_); }

const Combatant *ActionResolver::held_by_another(const Item &item) const {
    const auto *holder = handler_.holder_of(item);
    return holder == &actor_ ? nullptr : holder;
}

void ActionResolver::refuse_held(const Item &item, const Combatant &holder) const {
    msg(fmt::format("$You() $conj(reach) for {}, but it belongs to {}.", item.name(), you(holder)));
}

Edge ActionResolver::consume_edge(const Combatant &defender) {
    // Both flags are used up, even when they cancel out.
    const auto advantage = handler_.advantage_matrix().consume(actor_, defender);
    const auto disadvantage = handler_.disadvantage_matrix().consume(actor_, defender);
    return combine_edge(advantage, disadvantage);
}

CheckResult ActionResolver::opposed_check(const Combatant &defender, Ability attack_type, Ability defense_type) {
    const auto edge = consume_edge(defender);
    const auto result =
        AbilityCheck::opposed(handler_.config(), actor_, defender, attack_type, defense_type, edge).roll(handler_.rng());
    handler_.logger().debug("{} rolls {} {} ({}) against {}'s {} of {}: {}", actor_.name(), to_short_string(attack_type),
                            result.total, result.natural, defender.name(), to_short_string(defense_type),
                            result.target, result.success ? "success" : "failure");
    return result;
}

bool ActionResolver::is_standing(const Combatant &combatant) const {
    return handler_.is_engaged(combatant) && !combatant.is_down();
}

namespace resolvers {

void DoNothing::execute() { msg("$You() $conj(hesitate), doing nothing."); }

bool Attack::can_use() const { return action_.target && is_standing(*action_.target); }

void Attack::execute() {
    if (!can_use()) {
        msg("$You() $conj(look) around for someone to attack, but $conj(find) nobody.");
        return;
    }
    auto &target = *action_.target;
    const auto &weapon = actor_.equipment().weapon();
    const auto &profile = weapon.weapon_profile();
    const auto check = opposed_check(target, profile.attack_type, profile.defense_type);
    // A natural 1 always misses.
    if (check.quality == Quality::CriticalFailure) {
        msg(fmt::format("$You() $conj(fumble) with {} and $conj(miss) {} completely.", weapon.name(), you(target)));
        return;
    }
    if (!check.success) {
        msg(fmt::format("$You() $conj(swing) {} at {} but $conj(miss).", weapon.name(), you(target)));
        return;
    }
    auto damage = profile.damage.roll(handler_.rng());
    if (check.quality == Quality::CriticalSuccess)
        damage += profile.damage.roll(handler_.rng());
    damage = std::max(0, damage);
    target.hp(target.hp() - damage);
    msg(fmt::format("$You() {}$conj(hit) {} with {} for {} damage.",
                    check.quality == Quality::CriticalSuccess ? "critically " : "", you(target), weapon.name(), damage));
}

bool Stunt::can_use() const {
    return action_.recipient && action_.target && is_standing(*action_.recipient) && is_standing(*action_.target);
}

const Combatant &Stunt::defender() const {
    if (action_.recipient == action_.target || !action_.advantage)
        return *action_.recipient;
    return *action_.target;
}

void Stunt::execute() {
    if (!can_use()) {
        msg("$You() $conj(attempt) a stunt, but there's no-one left to pull it on.");
        return;
    }
    const auto &recipient = *action_.recipient;
    const auto &target = *action_.target;
    const auto check = opposed_check(defender(), action_.stunt_type, action_.defense_type);
    if (!check.success) {
        msg(fmt::format("$You() $conj(attempt) a {} stunt, but {} {} not fooled.", to_long_string(action_.stunt_type),
                        you(defender()), &defender() == &actor_ ? "$conj(are)" : "is"));
        return;
    }
    if (action_.advantage) {
        give_advantage(recipient, target);
        msg(fmt::format("$You() $conj(use) {} to give {} an advantage against {}!", to_long_string(action_.stunt_type),
                        you(recipient), you(target)));
    } else {
        give_disadvantage(recipient, target);
        msg(fmt::format("$You() $conj(use) {} to put {} at a disadvantage against {}!",
                        to_long_string(action_.stunt_type), you(recipient), you(target)));
    }
}

bool UseItem::can_use() const {
    return action_.item && action_.item->is_usable() && !held_by_another(*action_.item) && action_.target
           && handler_.is_engaged(*action_.target);
}

void UseItem::execute() {
    if (action_.item) {
        if (const auto *holder = held_by_another(*action_.item)) {
            refuse_held(*action_.item, *holder);
            return;
        }
    }
    if (!can_use()) {
        msg(fmt::format("$You() $conj(reach) for {}, but it's no use.",
                        action_.item ? action_.item->name() : std::string_view("something")));
        return;
    }
    auto &item = *action_.item;
    auto &target = *action_.target;
    const auto hp_before = target.hp();
    item.apply_effect(actor_, target, handler_.rng());
    if (&target == &actor_)
        msg(fmt::format("$You() $conj(use) {}.", item.name()));
    else
        msg(fmt::format("$You() $conj(use) {} on {}.", item.name(), you(target)));
    if (target.hp() != hp_before)
        handler_.logger().debug("{} used {} on {}: health {} -> {}", actor_.name(), item.name(), target.name(),
                                hp_before, target.hp());
    if (const auto uses = item.uses()) {
        item.uses(*uses - 1);
        if (*uses - 1 <= 0) {
            item.destroy();
            actor_.equipment().remove(item);
            msg(fmt::format("{} is used up.", item.name()));
        }
    }
}

bool Wield::can_use() const {
    return action_.item && !action_.item->is_destroyed() && !held_by_another(*action_.item);
}

void Wield::execute() {
    if (action_.item) {
        if (const auto *holder = held_by_another(*action_.item)) {
            refuse_held(*action_.item, *holder);
            return;
        }
    }
    if (!can_use()) {
        msg("$You() $conj(fumble) for something to wield, but it's gone.");
        return;
    }
    auto &item = *action_.item;
    auto &equipment = actor_.equipment();
    if (equipment.slot(item.wield_location()) == &item) {
        msg(fmt::format("$You() $conj(are) already using {}.", item.name()));
        return;
    }
    equipment.move(item);
    msg(fmt::format("$You() $conj(ready) {}.", item.name()));
}

void Flee::execute() {
    if (handler_.is_fleeing(actor_)) {
        msg("$You() $conj(keep) backing away from the fight.");
        return;
    }
    flee(actor_);
    msg("$You() $conj(try) to flee from combat!");
}

bool Hinder::can_use() const { return action_.target && is_standing(*action_.target); }

void Hinder::execute() {
    if (!can_use()) {
        msg("$You() $conj(look) for someone to block, but there's no-one there.");
        return;
    }
    auto &target = *action_.target;
    if (!handler_.is_fleeing(target)) {
        msg(fmt::format("$You() $conj(move) to block {}, but there's no retreat to stop.", you(target)));
        return;
    }
    if (opposed_check(target, Ability::Dex, Ability::Dex).success) {
        unflee(target);
        msg(fmt::format("$You() $conj(block) {} escape!", your(target)));
    } else {
        msg(fmt::format("$You() $conj(try) to block {} escape, but $conj(are) too slow.", your(target)));
    }
}

}

std::unique_ptr<ActionResolver> make_resolver(CombatHandler &handler, Combatant &actor, const Action &action) {
    return std::visit(
        Visitor{[&](const actions::DoNothing &) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::DoNothing>(handler, actor);
                },
                [&](const actions::Attack &a) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::Attack>(handler, actor, a);
                },
                [&](const actions::Stunt &a) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::Stunt>(handler, actor, a);
                },
                [&](const actions::UseItem &a) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::UseItem>(handler, actor, a);
                },
                [&](const actions::Wield &a) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::Wield>(handler, actor, a);
                },
                [&](const actions::Flee &) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::Flee>(handler, actor);
                },
                [&](const actions::Hinder &a) -> std::unique_ptr<ActionResolver> {
                    return std::make_unique<resolvers::Hinder>(handler, actor, a);
                }},
        action);
}

}
