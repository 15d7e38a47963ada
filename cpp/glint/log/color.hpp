#pragma once
/*
================================================================================
Log: Console Colors
FILE: cpp/glint/log/color.hpp

Purpose:
  - The sixteen classic console colors used by the level color table and the
    fatal error screen.
  - Mapping to ANSI SGR codes for terminals (see console.hpp).
================================================================================
*/

#include <string_view>

namespace glint {

enum class Color : int {
  Black = 0,
  DarkBlue,
  DarkGreen,
  DarkCyan,
  DarkRed,
  DarkMagenta,
  DarkYellow,
  Gray,
  DarkGray,
  Blue,
  Green,
  Cyan,
  Red,
  Magenta,
  Yellow,
  White
};

const char* to_string(Color c) noexcept;

// Case-insensitive inverse of to_string(). Throws ConfigError on unknown names.
Color parse_color(std::string_view name);

// SGR parameter selecting c as foreground (30-37, 90-97).
int ansi_foreground_code(Color c) noexcept;

// SGR parameter selecting c as background (40-47, 100-107).
int ansi_background_code(Color c) noexcept;

} // namespace glint
