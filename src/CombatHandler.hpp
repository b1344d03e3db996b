/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Action.hpp"
#include "AdvantageMatrix.hpp"
#include "Location.hpp"
#include "Logging.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fray {

class Combatant;
class Configuration;
class Item;
class Rng;

// Thrown when asked to do something on behalf of a combatant that isn't part of the fight.
class NotInCombat : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Thrown when a handler is used after its combat has ended.
class CombatStopped : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

using HandlerId = uint32_t;

// Runs one fight between everyone engaged in it, one turn at a time. Each combatant declares at
// most one action per turn with queue_action(). execute_full_turn() then resolves every declaration
// in the order the combatants joined, against the state as it stands at that moment: an earlier
// action can take the target of a later one out of the fight. Once a turn is over, anyone down or
// escaped is removed, and if no two opposing sides remain the combat stops.
//
// The handler doesn't lock. Callers that declare actions from several threads must serialize
// queue_action() against execute_full_turn() themselves, typically by doing both from the same
// ticker.
class CombatHandler {
public:
    // Dependencies on the world outside the fight.
    struct Dependencies {
        virtual ~Dependencies() = default;
        virtual Rng &rng() = 0;
        virtual Logger &logger() = 0;
        [[nodiscard]] virtual const Configuration &config() const = 0;
        // The handler a combatant is currently engaged with, or null.
        [[nodiscard]] virtual CombatHandler *handler_for(const Combatant &combatant) const = 0;
        virtual void engage(Combatant &combatant, CombatHandler &handler) = 0;
        virtual void disengage(const Combatant &combatant) = 0;
    };

    // One combatant's place in the fight, with the action it has declared for the coming turn.
    struct Engagement {
        Combatant *combatant;
        std::optional<Action> queued;
    };

    struct Sides {
        std::vector<Combatant *> allies;
        std::vector<Combatant *> enemies;
    };

    CombatHandler(HandlerId id, Location &location, Dependencies &dependencies);
    CombatHandler(const CombatHandler &) = delete;
    CombatHandler &operator=(const CombatHandler &) = delete;
    CombatHandler(CombatHandler &&) = delete;
    CombatHandler &operator=(CombatHandler &&) = delete;

    // Null once the combat has stopped.
    [[nodiscard]] std::optional<HandlerId> id() const noexcept { return id_; }
    [[nodiscard]] bool is_stopped() const noexcept { return !id_.has_value(); }
    [[nodiscard]] Location &location() const noexcept { return location_; }
    // Number of turns resolved so far.
    [[nodiscard]] int turn() const noexcept { return turn_; }
    [[nodiscard]] int flee_timeout() const noexcept { return flee_timeout_; }

    // In the order the combatants joined, which is the order they act in.
    [[nodiscard]] const std::vector<Engagement> &combatants() const noexcept { return combatants_; }
    [[nodiscard]] bool is_engaged(const Combatant &combatant) const;
    [[nodiscard]] const std::optional<Action> &queued_action(const Combatant &combatant) const;
    [[nodiscard]] const AdvantageMatrix &advantage_matrix() const noexcept { return advantage_; }
    [[nodiscard]] const AdvantageMatrix &disadvantage_matrix() const noexcept { return disadvantage_; }
    [[nodiscard]] AdvantageMatrix &advantage_matrix() noexcept { return advantage_; }
    [[nodiscard]] AdvantageMatrix &disadvantage_matrix() noexcept { return disadvantage_; }
    // Fleeing combatants, mapped to the number of turns that had been resolved when they started to flee.
    [[nodiscard]] const std::unordered_map<const Combatant *, int> &fleeing_combatants() const noexcept {
        return fleeing_;
    }
    [[nodiscard]] bool is_fleeing(const Combatant &combatant) const;
    // Combatants taken out of the fight, either down or escaped, in the order they left.
    [[nodiscard]] const std::vector<const Combatant *> &defeated_combatants() const noexcept { return defeated_; }
    // The engaged combatant carrying item, or null if nobody in the fight has it.
    [[nodiscard]] const Combatant *holder_of(const Item &item) const;

    // Adding a combatant who is already part of this fight does nothing. A combatant who escaped
    // earlier and rejoins is no longer counted among the defeated.
    void add_combatant(Combatant &combatant);
    void add_combatants(const std::vector<Combatant *> &combatants);
    // Takes a combatant out of every table. Doesn't check whether that ends the combat.
    void remove_combatant(const Combatant &combatant);
    // Everyone else in the fight, split by whether combatant is hostile to them.
    [[nodiscard]] Sides get_sides(const Combatant &combatant) const;
    // Ends the fight: everyone is disengaged, all tables are cleared and the handler loses its id.
    // Calling it again does nothing.
    void stop_combat();

    // Broadcasts a message template to the location, with the current combatants' names available
    // as $You(name) references.
    void msg(std::string_view text, const Combatant *from = nullptr, const Exclusions &exclude = {}) const;
    [[nodiscard]] NameMapping name_mapping() const;

    // Declares combatant's action for the next turn, replacing any earlier declaration.
    void queue_action(const Combatant &combatant, Action action);
    // Resolves combatant's declaration, or does nothing if it didn't make one. A combatant that is
    // already down doesn't get to act.
    void execute_next_action(Combatant &combatant);
    // Resolves everyone's declarations, then removes the defeated and the escaped and stops the
    // combat if it's over.
    void execute_full_turn();

    // A view of the fight from viewer's side: allies with their health, enemies with their condition.
    [[nodiscard]] std::string combat_summary(const Combatant &viewer) const;

    void flee(const Combatant &combatant);
    void unflee(const Combatant &combatant);

    [[nodiscard]] Rng &rng() const;
    [[nodiscard]] Logger &logger() const;
    [[nodiscard]] const Configuration &config() const;

private:
    void check_running(std::string_view what) const;
    [[nodiscard]] Engagement &engagement_of(const Combatant &combatant);
    [[nodiscard]] const Engagement &engagement_of(const Combatant &combatant) const;
    void remove_defeated();
    void remove_escaped();
    [[nodiscard]] bool is_over() const;
    void announce_result() const;

    std::optional<HandlerId> id_;
    Location &location_;
    Dependencies &dependencies_;
    int turn_{};
    int flee_timeout_;
    std::vector<Engagement> combatants_;
    AdvantageMatrix advantage_;
    AdvantageMatrix disadvantage_;
    std::unordered_map<const Combatant *, int> fleeing_;
    std::vector<const Combatant *> defeated_;
};

}
