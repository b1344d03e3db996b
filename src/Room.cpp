/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Room.hpp"
#include "Act.hpp"
#include "Character.hpp"

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/remove.hpp>

namespace fray {

void Room::enter(Character &character) {
    if (auto *previous = dynamic_cast<Room *>(character.location()); previous && previous != this)
        previous->leave(character);
    if (ranges::find(occupants_, &character) == occupants_.end())
        occupants_.push_back(&character);
    character.location(this);
}

void Room::leave(Character &character) {
    occupants_.erase(ranges::remove(occupants_, &character), occupants_.end());
    if (character.location() == this)
        character.location(nullptr);
}

void Room::broadcast(std::string_view text, const Combatant *from, const Exclusions &exclude,
                     const NameMapping &mapping) {
    for (auto *occupant : occupants_) {
        if (ranges::find(exclude, static_cast<const Combatant *>(occupant)) != exclude.end())
            continue;
        occupant->send_to(format_act(text, *occupant, from, mapping, logger_));
    }
}

}
