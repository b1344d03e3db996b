/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <array>
#include <cstddef>
#include <magic_enum.hpp>

namespace fray {

// A fixed-size table holding one T for every enumerator of Enum, indexed by the enum itself.
template <typename Enum, typename T, size_t Size = magic_enum::enum_count<Enum>()>
class PerEnum {
    std::array<T, Size> ts_{};

public:
    constexpr PerEnum() = default;
    constexpr T &operator[](Enum e) { return ts_[*magic_enum::enum_index(e)]; }
    constexpr const T &operator[](Enum e) const { return ts_[*magic_enum::enum_index(e)]; }
    void fill(const T &value) { ts_.fill(value); }
};

}
