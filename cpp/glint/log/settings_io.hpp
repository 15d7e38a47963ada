#pragma once
/*
================================================================================
Log: Settings File Loader
FILE: cpp/glint/log/settings_io.hpp

Format (one entry per line):
  # comment
  log_to_file = true
  log_file = logs/app.log
  log_format = {timestamp} [{level}] {message}
  log_to_console = yes
  use_console_colors = off
  show_fatal_error_screen = 0
  fatal_error_screen_color = DarkRed
  fatal_log_throws_on_error = true
  color.WARN = Magenta
  color.DEBUG = none

  - Values run to end of line and are trimmed; no quoting.
  - Booleans: true/false, 1/0, yes/no, on/off (case-insensitive).
  - color.<LEVEL> = none removes that level from level_colors.
  - Keys not listed fail with ConfigError naming the line.
================================================================================
*/

#include <string>
#include <string_view>

#include "glint/log/settings.hpp"

namespace glint {

// Value of a color.<LEVEL> key that removes the level from level_colors.
inline constexpr const char* kNoColor = "none";

// Applies every entry of text on top of s. Throws ConfigError on the first bad line.
void apply_settings_text(std::string_view text, LoggerSettings& s);

// Defaults + apply_settings_text(file contents) + validate_or_throw().
// Throws IOError if the file cannot be read.
LoggerSettings load_settings_file(const std::string& path);

// Inverse of apply_settings_text(); every key is written, levels without a
// color as "none". Throws ConfigError for log_file / log_format values with a
// line break or surrounding whitespace.
std::string settings_to_text(const LoggerSettings& s);

} // namespace glint
