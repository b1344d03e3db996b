/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Rng.hpp"

namespace fray {

int Rng::dice(int number, int size) noexcept {
    if (size == 0)
        return 0;
    if (size == 1)
        return number;

    int sum = 0;
    for (auto idice = 0; idice < number; idice++)
        sum += number_range(1, size);

    return sum;
}

int SeededRng::number_range(int from, int to) noexcept {
    if (to <= from)
        return from;
    std::uniform_int_distribution<int> distribution(from, to);
    return distribution(engine_);
}

}
