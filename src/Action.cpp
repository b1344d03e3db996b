/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Action.hpp"
#include "Visitor.hpp"

#include <magic_enum.hpp>

namespace fray {

ActionKey key_of(const Action &action) noexcept {
    return std::visit(Visitor{[](const actions::DoNothing &) { return ActionKey::Nothing; },
                              [](const actions::Attack &) { return ActionKey::Attack; },
                              [](const actions::Stunt &) { return ActionKey::Stunt; },
                              [](const actions::UseItem &) { return ActionKey::Use; },
                              [](const actions::Wield &) { return ActionKey::Wield; },
                              [](const actions::Flee &) { return ActionKey::Flee; },
                              [](const actions::Hinder &) { return ActionKey::Hinder; }},
                      action);
}

std::string_view to_string(ActionKey key) {
    using namespace std::literals;
    switch (key) {
    case ActionKey::Nothing: return "nothing"sv;
    case ActionKey::Attack: return "attack"sv;
    case ActionKey::Stunt: return "stunt"sv;
    case ActionKey::Use: return "use"sv;
    case ActionKey::Wield: return "wield"sv;
    case ActionKey::Flee: return "flee"sv;
    case ActionKey::Hinder: return "hinder"sv;
    }
    return magic_enum::enum_name(key);
}

}
