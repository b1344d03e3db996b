/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <cstdint>
#include <random>

namespace fray {

// The source of all randomness in combat. Everything else is built on number_range() so that
// tests can substitute a provider that returns known values.
class Rng {
public:
    virtual ~Rng() = default;
    // A uniformly distributed integer in the closed range [from, to].
    virtual int number_range(int from, int to) noexcept = 0;
    // Sum of 'number' rolls of a die with 'size' faces.
    virtual int dice(int number, int size) noexcept;
};

class SeededRng final : public Rng {
    std::mt19937 engine_;

public:
    explicit SeededRng(uint32_t seed) : engine_(seed) {}
    int number_range(int from, int to) noexcept override;
};

class FakeRng final : public Rng {
    int result_;

public:
    explicit FakeRng(int result) : result_(result) {}
    int number_range(int, int) noexcept override { return result_; }
    void result(int result) noexcept { result_ = result; }
};

}
