/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "common/Configuration.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace fray;

namespace {

// Sets an environment variable for the lifetime of the guard, then puts back whatever was there.
class ScopedEnv {
public:
    ScopedEnv(std::string name, const char *value) : name_(std::move(name)) {
        if (const auto *previous = std::getenv(name_.c_str()))
            previous_ = previous;
        if (value)
            REQUIRE(setenv(name_.c_str(), value, 1) == 0);
        else
            REQUIRE(unsetenv(name_.c_str()) == 0);
    }
    ~ScopedEnv() {
        if (previous_)
            setenv(name_.c_str(), previous_->c_str(), 1);
        else
            unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

}

TEST_CASE("Configuration defaults") {
    ScopedEnv flee_timeout(FRAY_FLEE_TIMEOUT_ENV, nullptr);
    ScopedEnv die_size(FRAY_DIE_SIZE_ENV, nullptr);
    ScopedEnv defense_base(FRAY_DEFENSE_BASE_ENV, nullptr);
    ScopedEnv log_level(FRAY_LOG_LEVEL_ENV, nullptr);
    Configuration config;

    CHECK(config.flee_timeout() == 1);
    CHECK(config.die_size() == 20);
    CHECK(config.defense_base() == 10);
    CHECK(config.log_level() == spdlog::level::info);
}

TEST_CASE("Configuration from the environment") {
    ScopedEnv flee_timeout(FRAY_FLEE_TIMEOUT_ENV, "3");
    ScopedEnv die_size(FRAY_DIE_SIZE_ENV, "12");
    ScopedEnv defense_base(FRAY_DEFENSE_BASE_ENV, "8");
    ScopedEnv log_level(FRAY_LOG_LEVEL_ENV, "debug");
    Configuration config;

    CHECK(config.flee_timeout() == 3);
    CHECK(config.die_size() == 12);
    CHECK(config.defense_base() == 8);
    CHECK(config.log_level() == spdlog::level::debug);
}

TEST_CASE("Bad configuration") {
    SECTION("numbers must be whole") {
        ScopedEnv die_size(FRAY_DIE_SIZE_ENV, "d20");
        REQUIRE_THROWS_WITH(Configuration(),
                            "An environment variable called FRAY_DIE_SIZE must be a whole number of at least 1");
    }
    SECTION("numbers must be positive") {
        ScopedEnv flee_timeout(FRAY_FLEE_TIMEOUT_ENV, "0");
        REQUIRE_THROWS_AS(Configuration(), std::invalid_argument);
    }
    SECTION("no trailing junk") {
        ScopedEnv defense_base(FRAY_DEFENSE_BASE_ENV, "10 ");
        REQUIRE_THROWS_AS(Configuration(), std::invalid_argument);
    }
    SECTION("log levels must exist") {
        ScopedEnv log_level(FRAY_LOG_LEVEL_ENV, "loud");
        REQUIRE_THROWS_WITH(Configuration(), "An environment variable called FRAY_LOG_LEVEL must name a log level");
    }
    SECTION("off is a log level") {
        ScopedEnv log_level(FRAY_LOG_LEVEL_ENV, "off");
        CHECK(Configuration().log_level() == spdlog::level::off);
    }
}
