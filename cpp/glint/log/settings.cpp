#include "glint/log/settings.hpp"

#include "glint/core/errors.hpp"

namespace glint {

LevelColorTable default_level_colors() {
  return LevelColorTable{
    {Level::INFO,    Color::White},
    {Level::WARN,    Color::Yellow},
    {Level::ERROR,   Color::Red},
    {Level::FATAL,   Color::DarkRed},
    {Level::SUCCESS, Color::Green},
    {Level::DEBUG,   Color::DarkGray},
    {Level::NETWORK, Color::Blue},
  };
}

Color LoggerSettings::color_for(Level lvl) const {
  const auto it = level_colors.find(lvl);
  if (it == level_colors.end()) {
    throw ConfigError(std::string("LoggerSettings: level_colors has no entry for ") + to_string(lvl));
  }
  return it->second;
}

void LoggerSettings::validate_or_throw() const {
  if (log_to_file && log_file.empty()) {
    throw ConfigError("LoggerSettings: log_file must be set when log_to_file is enabled");
  }
  // Compiling is the validation; the result is discarded.
  (void)LogTemplate::compile(log_format);
}

bool operator==(const LoggerSettings& a, const LoggerSettings& b) {
  return a.log_to_file == b.log_to_file &&
         a.log_file == b.log_file &&
         a.log_format == b.log_format &&
         a.log_to_console == b.log_to_console &&
         a.use_console_colors == b.use_console_colors &&
         a.show_fatal_error_screen == b.show_fatal_error_screen &&
         a.fatal_error_screen_color == b.fatal_error_screen_color &&
         a.fatal_log_throws_on_error == b.fatal_log_throws_on_error &&
         a.level_colors == b.level_colors;
}

} // namespace glint
