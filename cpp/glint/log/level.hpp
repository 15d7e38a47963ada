#pragma once
/*
================================================================================
Log: Severity Levels
FILE: cpp/glint/log/level.hpp

Purpose:
  - Closed set of severities understood by the logger.
  - Symbolic names are what the {level} placeholder renders.

Notes:
  - DEBUG is only emitted while a debugger is attached (see logger.hpp).
  - Order has no filtering meaning; there is no verbosity threshold.
================================================================================
*/

#include <array>
#include <string_view>

namespace glint {

enum class Level : int {
  INFO = 0,
  WARN = 1,
  ERROR = 2,
  FATAL = 3,
  SUCCESS = 4,
  DEBUG = 5,   // only logged if a debugger is attached
  NETWORK = 6
};

inline constexpr std::array<Level, 7> kAllLevels = {
  Level::INFO, Level::WARN, Level::ERROR, Level::FATAL,
  Level::SUCCESS, Level::DEBUG, Level::NETWORK
};

// Symbolic name, e.g. "WARN".
const char* to_string(Level lvl) noexcept;

// Case-insensitive inverse of to_string(). Throws ConfigError on unknown names.
Level parse_level(std::string_view name);

} // namespace glint
