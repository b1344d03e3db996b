/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

namespace fray {

// Builds a std::visit visitor out of a set of lambdas, one per alternative.
template <typename... Ts>
struct Visitor : Ts... {
    using Ts::operator()...;
};

}
