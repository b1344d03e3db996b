/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <spdlog/common.h>

#include <string>

namespace fray {

/**
 * Environment variables read by Configuration. All are optional.
 */
static inline constexpr auto FRAY_FLEE_TIMEOUT_ENV = "FRAY_FLEE_TIMEOUT";
static inline constexpr auto FRAY_DIE_SIZE_ENV = "FRAY_DIE_SIZE";
static inline constexpr auto FRAY_DEFENSE_BASE_ENV = "FRAY_DEFENSE_BASE";
static inline constexpr auto FRAY_LOG_LEVEL_ENV = "FRAY_LOG_LEVEL";

/**
 * Accessors for the tunable numbers of combat. Values are read from the environment
 * once, when the Configuration is constructed.
 */
class Configuration {
public:
    Configuration();
    // Turns a retreat must go unhindered before the combatant escapes.
    [[nodiscard]] int flee_timeout() const noexcept;
    // Faces on the die every check is rolled with.
    [[nodiscard]] int die_size() const noexcept;
    // Added to an ability bonus to get the value an opposing check must beat.
    [[nodiscard]] int defense_base() const noexcept;
    [[nodiscard]] spdlog::level::level_enum log_level() const noexcept;

private:
    [[nodiscard]] int positive_int_env(const std::string &envkey, const int default_value) const;
    [[nodiscard]] spdlog::level::level_enum log_level_env(const std::string &envkey) const;

    int flee_timeout_;
    int die_size_;
    int defense_base_;
    spdlog::level::level_enum log_level_;
};

}
