/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fray {

namespace {
std::shared_ptr<spdlog::sinks::sink> console_sink;
}

Logger logger_for(std::string name) {
    if (!console_sink)
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = spdlog::logger(std::move(name), console_sink);
    logger.set_level(spdlog::default_logger()->level());
    return logger;
}

Logger null_logger() { return spdlog::logger("null", std::make_shared<spdlog::sinks::null_sink_mt>()); }

void set_log_level(spdlog::level::level_enum level) { spdlog::set_level(level); }

}
