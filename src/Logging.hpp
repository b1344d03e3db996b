/*************************************************************************/
/*  Fray turn-based combat engine source code                            */
/*  (C) 2026 Fray Development Team                                       */
/*  See README for copyrights                                            */
/*************************************************************************/
#pragma once

#include <string>

#include <spdlog/logger.h>

namespace fray {

using Logger = spdlog::logger;

// Sets the default root log level, and for any logger subsequently created by logger_for.
// Probably only worthwhile calling before any Loggers are created (e.g. in main()).
void set_log_level(spdlog::level::level_enum level);
Logger logger_for(std::string name);
// A logger that discards everything, for tests and callers that don't care.
Logger null_logger();

}
