#pragma once
/*
================================================================================
Log: Logger Settings
FILE: cpp/glint/log/settings.hpp

Purpose:
  - Every knob the logger reads lives in one plain struct.
  - Mutable at any time between log calls; the logger reads it per call.

Hardening:
  - validate_or_throw() catches a bad template or an empty file path early.
  - color_for() throws instead of defaulting when the table lacks a level.
================================================================================
*/

#include <map>
#include <string>

#include "glint/log/color.hpp"
#include "glint/log/format.hpp"
#include "glint/log/level.hpp"

namespace glint {

using LevelColorTable = std::map<Level, Color>;

// INFO White, WARN Yellow, ERROR Red, FATAL DarkRed, SUCCESS Green,
// DEBUG DarkGray, NETWORK Blue.
LevelColorTable default_level_colors();

struct LoggerSettings {
  // ----------------------------- File sink ---------------------------------
  bool log_to_file = true;

  // Appended to, never truncated. Relative paths resolve against the CWD.
  std::string log_file = ".log";

  // ----------------------------- Console sink ------------------------------
  // See format.hpp for the placeholder syntax.
  std::string log_format = kDefaultLogFormat;

  bool log_to_console = true;
  bool use_console_colors = true;

  // ----------------------------- Fatal handling ----------------------------
  // Full-screen banner + key press wait instead of the plain console line.
  bool show_fatal_error_screen = true;
  Color fatal_error_screen_color = Color::DarkRed;

  // Raise FatalError("Fatal error: " + msg) after a FATAL log is written.
  bool fatal_log_throws_on_error = true;

  // Only read while use_console_colors is true.
  LevelColorTable level_colors = default_level_colors();

  // Throws ConfigError if level has no entry.
  Color color_for(Level lvl) const;

  void validate_or_throw() const;

  static LoggerSettings defaults() {
    LoggerSettings s;
    return s;
  }
};

bool operator==(const LoggerSettings& a, const LoggerSettings& b);
inline bool operator!=(const LoggerSettings& a, const LoggerSettings& b) { return !(a == b); }

} // namespace glint
