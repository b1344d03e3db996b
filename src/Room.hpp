/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include "Location.hpp"
#include "Logging.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fray {

class Character;

// A place characters can be in. Broadcasts are rendered separately for each occupant, so that
// everyone reads "You" for themselves.
class Room : public Location {
public:
    Room(std::string name, Logger &logger, bool combat_allowed = true)
        : name_(std::move(name)), logger_(logger), combat_allowed_(combat_allowed) {}
    Room(const Room &) = delete;
    Room &operator=(const Room &) = delete;

    [[nodiscard]] std::string_view name() const noexcept { return name_; }

    void enter(Character &character);
    void leave(Character &character);
    [[nodiscard]] const std::vector<Character *> &occupants() const noexcept { return occupants_; }

    void broadcast(std::string_view text, const Combatant *from, const Exclusions &exclude,
                   const NameMapping &mapping) override;
    [[nodiscard]] bool allows_combat() const override { return combat_allowed_; }
    void allows_combat(bool allowed) noexcept { combat_allowed_ = allowed; }

private:
    std::string name_;
    Logger &logger_;
    bool combat_allowed_;
    std::vector<Character *> occupants_;
};

}
