/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "AbilityCheck.hpp"
#include "Action.hpp"

#include <memory>
#include <string_view>

namespace fray {

class CombatHandler;
class Combatant;
class Item;

// Resolves one declared action on behalf of its actor. Resolvers are created just before they
// execute and see the fight as it stands then, so any combatant or item an action names may have
// changed since it was declared. A resolver whose preconditions no longer hold says so and
// changes nothing.
class ActionResolver {
public:
    ActionResolver(CombatHandler &handler, Combatant &actor) : handler_(handler), actor_(actor) {}
    virtual ~ActionResolver() = default;

    // Whether the action still makes sense.
    [[nodiscard]] virtual bool can_use() const { return true; }
    virtual void execute() = 0;

    void give_advantage(const Combatant &recipient, const Combatant &target);
    void give_disadvantage(const Combatant &recipient, const Combatant &target);
    [[nodiscard]] bool has_advantage(const Combatant &recipient, const Combatant &target) const;
    [[nodiscard]] bool has_disadvantage(const Combatant &recipient, const Combatant &target) const;
    bool lose_advantage(const Combatant &recipient, const Combatant &target);
    bool lose_disadvantage(const Combatant &recipient, const Combatant &target);
    void flee(const Combatant &combatant);
    void unflee(const Combatant &combatant);
    // Broadcasts a message template with the actor as $You().
    void msg(std::string_view text) const;

protected:
    // Uses up any advantage or disadvantage the actor holds against defender.
    [[nodiscard]] Edge consume_edge(const Combatant &defender);
    // The actor's attack_type against defender's defense_type, with whatever edge the actor has.
    [[nodiscard]] CheckResult opposed_check(const Combatant &defender, Ability attack_type, Ability defense_type);
    // Whether the combatant is still in the fight and on its feet.
    [[nodiscard]] bool is_standing(const Combatant &combatant) const;
    // Someone else in the fight who carries item, or null if it's the actor's or nobody's.
    [[nodiscard]] const Combatant *held_by_another(const Item &item) const;
    // Tells the fight that the actor can't have item because holder carries it.
    void refuse_held(const Item &item, const Combatant &holder) const;

    CombatHandler &handler_;
    Combatant &actor_;
};

namespace resolvers {

class DoNothing final : public ActionResolver {
public:
    using ActionResolver::ActionResolver;
    void execute() override;
};

class Attack final : public ActionResolver {
public:
    Attack(CombatHandler &handler, Combatant &actor, const actions::Attack &action)
        : ActionResolver(handler, actor), action_(action) {}
    [[nodiscard]] bool can_use() const override;
    void execute() override;

private:
    actions::Attack action_;
};

class Stunt final : public ActionResolver {
public:
    Stunt(CombatHandler &handler, Combatant &actor, const actions::Stunt &action)
        : ActionResolver(handler, actor), action_(action) {}
    [[nodiscard]] bool can_use() const override;
    void execute() override;

private:
    // Whoever resists the stunt: the target when granting advantage against them, the recipient
    // when saddling them with disadvantage.
    [[nodiscard]] const Combatant &defender() const;

    actions::Stunt action_;
};

class UseItem final : public ActionResolver {
public:
    UseItem(CombatHandler &handler, Combatant &actor, const actions::UseItem &action)
        : ActionResolver(handler, actor), action_(action) {}
    [[nodiscard]] bool can_use() const override;
    void execute() override;

private:
    actions::UseItem action_;
};

class Wield final : public ActionResolver {
public:
    Wield(CombatHandler &handler, Combatant &actor, const actions::Wield &action)
        : ActionResolver(handler, actor), action_(action) {}
    [[nodiscard]] bool can_use() const override;
    void execute() override;

private:
    actions::Wield action_;
};

class Flee final : public ActionResolver {
public:
    using ActionResolver::ActionResolver;
    void execute() override;
};

class Hinder final : public ActionResolver {
public:
    Hinder(CombatHandler &handler, Combatant &actor, const actions::Hinder &action)
        : ActionResolver(handler, actor), action_(action) {}
    [[nodiscard]] bool can_use() const override;
    void execute() override;

private:
    actions::Hinder action_;
};

}

// The resolver for a declared action.
[[nodiscard]] std::unique_ptr<ActionResolver> make_resolver(CombatHandler &handler, Combatant &actor,
                                                            const Action &action);

}
