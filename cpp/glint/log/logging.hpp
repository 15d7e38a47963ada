#pragma once
/*
================================================================================
Log: Process-Wide Facade
FILE: cpp/glint/log/logging.hpp

Purpose:
  - The one-liner API: glint::warn("disk low");
  - Backed by a single default Logger created on first use with
    LoggerSettings::defaults() and the stdio console.
  - glint::settings() returns that logger's settings; changes apply to every
    later call in the process.

Notes:
  - Not synchronized. See logger.hpp.
  - Code that wants isolation (tests, libraries) should own a Logger instead.
================================================================================
*/

#include <string_view>

#include "glint/log/level.hpp"
#include "glint/log/logger.hpp"
#include "glint/log/settings.hpp"

namespace glint {

Logger& default_logger();

// Mutable settings of default_logger().
LoggerSettings& settings();

// Core logging call. Throws FatalError for FATAL when
// settings().fatal_log_throws_on_error; IOError/ConfigError pass through.
void log(std::string_view message, Level lvl);

void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);
void fatal(std::string_view message);
void success(std::string_view message);
void debug(std::string_view message);
void network(std::string_view message);

} // namespace glint
