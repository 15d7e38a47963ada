#include "glint/log/color.hpp"

#include <string>

#include "glint/core/errors.hpp"
#include "glint/core/text.hpp"

namespace glint {

namespace {

constexpr Color kAllColors[] = {
  Color::Black, Color::DarkBlue, Color::DarkGreen, Color::DarkCyan,
  Color::DarkRed, Color::DarkMagenta, Color::DarkYellow, Color::Gray,
  Color::DarkGray, Color::Blue, Color::Green, Color::Cyan,
  Color::Red, Color::Magenta, Color::Yellow, Color::White
};

} // namespace

const char* to_string(Color c) noexcept {
  switch (c) {
    case Color::Black:       return "Black";
    case Color::DarkBlue:    return "DarkBlue";
    case Color::DarkGreen:   return "DarkGreen";
    case Color::DarkCyan:    return "DarkCyan";
    case Color::DarkRed:     return "DarkRed";
    case Color::DarkMagenta: return "DarkMagenta";
    case Color::DarkYellow:  return "DarkYellow";
    case Color::Gray:        return "Gray";
    case Color::DarkGray:    return "DarkGray";
    case Color::Blue:        return "Blue";
    case Color::Green:       return "Green";
    case Color::Cyan:        return "Cyan";
    case Color::Red:         return "Red";
    case Color::Magenta:     return "Magenta";
    case Color::Yellow:      return "Yellow";
    case Color::White:       return "White";
    default:                 return "Unknown";
  }
}

Color parse_color(std::string_view name) {
  for (Color c : kAllColors) {
    if (iequals(name, to_string(c))) return c;
  }
  throw ConfigError("unknown console color '" + std::string(name) + "'");
}

int ansi_foreground_code(Color c) noexcept {
  switch (c) {
    case Color::Black:       return 30;
    case Color::DarkRed:     return 31;
    case Color::DarkGreen:   return 32;
    case Color::DarkYellow:  return 33;
    case Color::DarkBlue:    return 34;
    case Color::DarkMagenta: return 35;
    case Color::DarkCyan:    return 36;
    case Color::Gray:        return 37;
    case Color::DarkGray:    return 90;
    case Color::Red:         return 91;
    case Color::Green:       return 92;
    case Color::Yellow:      return 93;
    case Color::Blue:        return 94;
    case Color::Magenta:     return 95;
    case Color::Cyan:        return 96;
    case Color::White:       return 97;
    default:                 return 39;  // terminal default
  }
}

int ansi_background_code(Color c) noexcept {
  // Background codes sit 10 above their foreground counterparts.
  return ansi_foreground_code(c) + 10;
}

} // namespace glint
