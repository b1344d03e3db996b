/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Configuration.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace fray {

Configuration::Configuration() {
    flee_timeout_ = positive_int_env(FRAY_FLEE_TIMEOUT_ENV, 1);
    die_size_ = positive_int_env(FRAY_DIE_SIZE_ENV, 20);
    defense_base_ = positive_int_env(FRAY_DEFENSE_BASE_ENV, 10);
    log_level_ = log_level_env(FRAY_LOG_LEVEL_ENV);
}

int Configuration::flee_timeout() const noexcept { return flee_timeout_; }
int Configuration::die_size() const noexcept { return die_size_; }
int Configuration::defense_base() const noexcept { return defense_base_; }
spdlog::level::level_enum Configuration::log_level() const noexcept { return log_level_; }

int Configuration::positive_int_env(const std::string &envkey, const int default_value) const {
    const auto *value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    const std::string_view text(value);
    int result{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size() || result < 1) {
        throw std::invalid_argument(
            fmt::format("An environment variable called {} must be a whole number of at least 1", envkey));
    }
    return result;
}

spdlog::level::level_enum Configuration::log_level_env(const std::string &envkey) const {
    const auto *value = std::getenv(envkey.c_str());
    if (!value)
        return spdlog::level::info;
    const auto level = spdlog::level::from_str(value);
    // from_str() maps anything it doesn't recognise to off.
    if (level == spdlog::level::off && std::string_view(value) != "off") {
        throw std::invalid_argument(fmt::format("An environment variable called {} must name a log level", envkey));
    }
    return level;
}

}
