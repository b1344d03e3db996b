/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "CombatHandler.hpp"
#include "Logging.hpp"

#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace fray {

class Combatant;
class Configuration;
class Rng;

// Thrown when a fight can't start or be joined.
class CombatNotAllowed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Owns every combat handler, and knows which handler each combatant is fighting in.
// Stopped handlers are kept until collect_garbage() so that anything still holding a reference
// to one can find out that the fight is over.
class CombatRegistry : public CombatHandler::Dependencies {
public:
    CombatRegistry(Rng &rng, Logger &logger, const Configuration &config)
        : rng_(rng), logger_(logger), config_(config) {}
    CombatRegistry(const CombatRegistry &) = delete;
    CombatRegistry &operator=(const CombatRegistry &) = delete;

    // The handler combatant is fighting in, or a new one in combatant's location with combatant
    // already added.
    CombatHandler &get_or_create(Combatant &combatant);
    // Gets combatant and target into the same fight, creating one if neither is fighting yet.
    CombatHandler &join_combat(Combatant &combatant, Combatant &target);
    // Destroys stopped handlers. Returns how many went.
    size_t collect_garbage();

    [[nodiscard]] size_t num_handlers() const noexcept { return handlers_.size(); }

    Rng &rng() override { return rng_; }
    Logger &logger() override { return logger_; }
    [[nodiscard]] const Configuration &config() const override { return config_; }
    [[nodiscard]] CombatHandler *handler_for(const Combatant &combatant) const override;
    void engage(Combatant &combatant, CombatHandler &handler) override;
    void disengage(const Combatant &combatant) override;

private:
    Rng &rng_;
    Logger &logger_;
    const Configuration &config_;
    HandlerId next_id_{1};
    std::vector<std::unique_ptr<CombatHandler>> handlers_;
    std::unordered_map<const Combatant *, CombatHandler *> engaged_;
};

}
