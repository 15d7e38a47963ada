#include "glint/log/settings_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "glint/core/errors.hpp"
#include "glint/core/text.hpp"

namespace glint {

namespace {

[[noreturn]] void bad_line(size_t line_no, const std::string& why) {
  throw ConfigError("settings line " + std::to_string(line_no) + ": " + why);
}

bool parse_bool(std::string_view v, size_t line_no) {
  if (iequals(v, "true") || v == "1" || iequals(v, "yes") || iequals(v, "on")) return true;
  if (iequals(v, "false") || v == "0" || iequals(v, "no") || iequals(v, "off")) return false;
  bad_line(line_no, "expected a boolean, got '" + std::string(v) + "'");
}

// Re-throws name-parse failures with the line number attached.
template <class F>
auto with_line(size_t line_no, F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const ConfigError& e) {
    bad_line(line_no, e.what());
  }
}

void apply_entry(std::string_view key, std::string_view value, size_t line_no, LoggerSettings& s) {
  if (key == "log_to_file") {
    s.log_to_file = parse_bool(value, line_no);
  } else if (key == "log_file") {
    s.log_file = std::string(value);
  } else if (key == "log_format") {
    s.log_format = std::string(value);
  } else if (key == "log_to_console") {
    s.log_to_console = parse_bool(value, line_no);
  } else if (key == "use_console_colors") {
    s.use_console_colors = parse_bool(value, line_no);
  } else if (key == "show_fatal_error_screen") {
    s.show_fatal_error_screen = parse_bool(value, line_no);
  } else if (key == "fatal_error_screen_color") {
    s.fatal_error_screen_color = with_line(line_no, [&] { return parse_color(value); });
  } else if (key == "fatal_log_throws_on_error") {
    s.fatal_log_throws_on_error = parse_bool(value, line_no);
  } else if (key.substr(0, 6) == "color.") {
    const Level lvl = with_line(line_no, [&] { return parse_level(key.substr(6)); });
    if (iequals(value, kNoColor)) {
      s.level_colors.erase(lvl);
    } else {
      s.level_colors[lvl] = with_line(line_no, [&] { return parse_color(value); });
    }
  } else {
    bad_line(line_no, "unknown key '" + std::string(key) + "'");
  }
}

const char* bool_text(bool b) noexcept { return b ? "true" : "false"; }

// Values are trimmed and end at the newline, so these cannot be read back.
const std::string& representable(const char* key, const std::string& value) {
  const bool has_newline = value.find_first_of("\r\n") != std::string::npos;
  if (has_newline || trim(value).size() != value.size()) {
    throw ConfigError(std::string("settings: ") + key +
                      " has a line break or surrounding whitespace and cannot be written");
  }
  return value;
}

} // namespace

void apply_settings_text(std::string_view text, LoggerSettings& s) {
  size_t line_no = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    const size_t nl = text.find('\n', pos);
    const size_t end = (nl == std::string_view::npos) ? text.size() : nl;
    std::string_view line = text.substr(pos, end - pos);
    ++line_no;
    pos = end + 1;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    line = trim(line);
    if (line.empty() || line.front() == '#') {
      if (nl == std::string_view::npos) break;
      continue;
    }

    const size_t eq = line.find('=');
    if (eq == std::string_view::npos) bad_line(line_no, "expected 'key = value'");

    const std::string_view key = trim(line.substr(0, eq));
    const std::string_view value = trim(line.substr(eq + 1));
    if (key.empty()) bad_line(line_no, "empty key");

    apply_entry(key, value, line_no, s);

    if (nl == std::string_view::npos) break;
  }
}

LoggerSettings load_settings_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    const int err = errno;
    throw IOError("cannot open settings file '" + path + "': " + std::strerror(err), path, err);
  }

  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    const int err = errno;
    throw IOError("cannot read settings file '" + path + "'", path, err);
  }

  LoggerSettings s = LoggerSettings::defaults();
  apply_settings_text(buf.str(), s);
  s.validate_or_throw();
  return s;
}

std::string settings_to_text(const LoggerSettings& s) {
  std::ostringstream oss;
  oss << "log_to_file = " << bool_text(s.log_to_file) << "\n"
      << "log_file = " << representable("log_file", s.log_file) << "\n"
      << "log_format = " << representable("log_format", s.log_format) << "\n"
      << "log_to_console = " << bool_text(s.log_to_console) << "\n"
      << "use_console_colors = " << bool_text(s.use_console_colors) << "\n"
      << "show_fatal_error_screen = " << bool_text(s.show_fatal_error_screen) << "\n"
      << "fatal_error_screen_color = " << to_string(s.fatal_error_screen_color) << "\n"
      << "fatal_log_throws_on_error = " << bool_text(s.fatal_log_throws_on_error) << "\n";
  for (Level lvl : kAllLevels) {
    const auto it = s.level_colors.find(lvl);
    oss << "color." << to_string(lvl) << " = "
        << (it == s.level_colors.end() ? kNoColor : to_string(it->second)) << "\n";
  }
  return oss.str();
}

} // namespace glint
