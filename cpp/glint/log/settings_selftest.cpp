/*
  Settings selftest

  Covers the configuration surface:
    1) Level / color names and ANSI codes.
    2) LoggerSettings defaults, color lookup and validation.
    3) Settings file parsing, error reporting and loading.

  Non-zero return code indicates failure.
*/

#include <string>

#include "glint/core/errors.hpp"
#include "glint/log/color.hpp"
#include "glint/log/level.hpp"
#include "glint/log/settings.hpp"
#include "glint/log/settings_io.hpp"
#include "glint/testing/selftest.hpp"
#include "glint/testing/temp_dir.hpp"

namespace glint {
namespace {

using namespace glint::selftest;

void test_level_names() {
  for (Level lvl : kAllLevels) {
    expect_true(parse_level(to_string(lvl)) == lvl, std::string("level: name round-trips for ") + to_string(lvl));
  }
  expect_true(parse_level("warn") == Level::WARN, "level: parse is case-insensitive");
  expect_throws<ConfigError>([] { (void)parse_level("VERBOSE"); }, "level: unknown name throws ConfigError");
}

void test_color_names_and_codes() {
  expect_true(parse_color("darkred") == Color::DarkRed, "color: parse is case-insensitive");
  expect_throws<ConfigError>([] { (void)parse_color("Chartreuse"); }, "color: unknown name throws ConfigError");

  expect_true(ansi_foreground_code(Color::DarkRed) == 31, "color: DarkRed foreground is 31");
  expect_true(ansi_background_code(Color::DarkRed) == 41, "color: DarkRed background is 41");
  expect_true(ansi_foreground_code(Color::White) == 97, "color: White foreground is 97");
  expect_true(ansi_background_code(Color::DarkGray) == 100, "color: DarkGray background is 100");
}

void test_defaults() {
  const LoggerSettings s = LoggerSettings::defaults();
  expect_true(s.log_to_file, "defaults: log_to_file on");
  expect_eq_str(s.log_file, ".log", "defaults: log_file");
  expect_eq_str(s.log_format, "{timestamp} [{level}] {message}", "defaults: log_format");
  expect_true(s.log_to_console, "defaults: log_to_console on");
  expect_true(s.use_console_colors, "defaults: use_console_colors on");
  expect_true(s.show_fatal_error_screen, "defaults: show_fatal_error_screen on");
  expect_true(s.fatal_error_screen_color == Color::DarkRed, "defaults: fatal screen is DarkRed");
  expect_true(s.fatal_log_throws_on_error, "defaults: fatal throws");

  expect_true(s.level_colors.size() == kAllLevels.size(), "defaults: one color per level");
  expect_true(s.color_for(Level::INFO) == Color::White, "defaults: INFO White");
  expect_true(s.color_for(Level::WARN) == Color::Yellow, "defaults: WARN Yellow");
  expect_true(s.color_for(Level::ERROR) == Color::Red, "defaults: ERROR Red");
  expect_true(s.color_for(Level::FATAL) == Color::DarkRed, "defaults: FATAL DarkRed");
  expect_true(s.color_for(Level::SUCCESS) == Color::Green, "defaults: SUCCESS Green");
  expect_true(s.color_for(Level::DEBUG) == Color::DarkGray, "defaults: DEBUG DarkGray");
  expect_true(s.color_for(Level::NETWORK) == Color::Blue, "defaults: NETWORK Blue");

  expect_no_throw([&] { s.validate_or_throw(); }, "defaults: validate");
}

void test_color_lookup_and_validation() {
  LoggerSettings s;
  s.level_colors.erase(Level::NETWORK);
  const std::string what = expect_throws<ConfigError>([&] { (void)s.color_for(Level::NETWORK); },
                                                      "color_for: missing entry throws ConfigError");
  expect_true(what.find("NETWORK") != std::string::npos, "color_for: error names the level");

  LoggerSettings bad_format;
  bad_format.log_format = "{when} {message}";
  expect_throws<ConfigError>([&] { bad_format.validate_or_throw(); }, "validate: bad template rejected");

  LoggerSettings no_path;
  no_path.log_file.clear();
  expect_throws<ConfigError>([&] { no_path.validate_or_throw(); }, "validate: empty log_file with file sink rejected");
  no_path.log_to_file = false;
  expect_no_throw([&] { no_path.validate_or_throw(); }, "validate: empty log_file allowed with file sink off");
}

void test_apply_settings_text() {
  LoggerSettings s;
  apply_settings_text(
      "# comment line\n"
      "\n"
      "log_to_file = no\n"
      "log_file = logs/app.log\n"
      "log_format = {level}: {message}\n"
      "log_to_console = ON\n"
      "use_console_colors = 0\n"
      "show_fatal_error_screen = false\n"
      "fatal_error_screen_color = darkblue\n"
      "fatal_log_throws_on_error = 1\r\n"
      "  color.warn  =  Magenta  \n",
      s);

  expect_true(!s.log_to_file, "settings text: log_to_file");
  expect_eq_str(s.log_file, "logs/app.log", "settings text: log_file");
  expect_eq_str(s.log_format, "{level}: {message}", "settings text: log_format keeps inner spaces");
  expect_true(s.log_to_console, "settings text: log_to_console");
  expect_true(!s.use_console_colors, "settings text: use_console_colors");
  expect_true(!s.show_fatal_error_screen, "settings text: show_fatal_error_screen");
  expect_true(s.fatal_error_screen_color == Color::DarkBlue, "settings text: fatal_error_screen_color");
  expect_true(s.fatal_log_throws_on_error, "settings text: fatal_log_throws_on_error (CRLF line)");
  expect_true(s.color_for(Level::WARN) == Color::Magenta, "settings text: color.WARN override");
  expect_true(s.color_for(Level::INFO) == Color::White, "settings text: other colors untouched");
}

void test_settings_text_errors() {
  LoggerSettings s;
  std::string what = expect_throws<ConfigError>(
      [&] { apply_settings_text("log_to_file = true\n\nlog_level = INFO\n", s); },
      "settings text: unknown key rejected");
  expect_true(what.find("line 3") != std::string::npos, "settings text: error names the line");

  expect_throws<ConfigError>([&] { apply_settings_text("log_to_console = maybe", s); },
                             "settings text: bad boolean rejected");
  expect_throws<ConfigError>([&] { apply_settings_text("color.VERBOSE = Red", s); },
                             "settings text: unknown level rejected");
  what = expect_throws<ConfigError>([&] { apply_settings_text("\ncolor.INFO = Mauve", s); },
                                    "settings text: unknown color rejected");
  expect_true(what.find("line 2") != std::string::npos, "settings text: color error names the line");
  expect_throws<ConfigError>([&] { apply_settings_text("just words", s); },
                             "settings text: missing '=' rejected");
}

void test_settings_text_round_trip() {
  LoggerSettings s;
  s.log_to_file = false;
  s.log_file = "out/x.log";
  s.log_format = "{0:%H:%M:%S.%f} {1} {2}";
  s.use_console_colors = false;
  s.fatal_error_screen_color = Color::DarkMagenta;
  s.level_colors[Level::DEBUG] = Color::Cyan;

  LoggerSettings back;
  apply_settings_text(settings_to_text(s), back);
  expect_true(back == s, "settings text: settings_to_text is read back unchanged");

  // A level without a color must stay without one after the round trip.
  LoggerSettings missing;
  missing.level_colors.erase(Level::WARN);
  const std::string text = settings_to_text(missing);
  expect_true(text.find("color.WARN = none\n") != std::string::npos, "settings text: missing color written as none");
  LoggerSettings reread;
  apply_settings_text(text, reread);
  expect_true(reread.level_colors.count(Level::WARN) == 0, "settings text: 'none' removes the color entry");
  expect_true(reread == missing, "settings text: missing color survives the round trip");
  expect_throws<ConfigError>([&] { (void)reread.color_for(Level::WARN); },
                             "settings text: reread missing color still fails loudly");

  // Values that trimming or line splitting would alter are refused.
  LoggerSettings padded;
  padded.log_format = "{message} ";
  expect_throws<ConfigError>([&] { (void)settings_to_text(padded); },
                             "settings text: trailing space in log_format refused");
  padded.log_format = kDefaultLogFormat;
  padded.log_file = " app.log";
  expect_throws<ConfigError>([&] { (void)settings_to_text(padded); },
                             "settings text: leading space in log_file refused");
  padded.log_file = "a\nb.log";
  expect_throws<ConfigError>([&] { (void)settings_to_text(padded); },
                             "settings text: line break in log_file refused");
}

void test_load_settings_file() {
  TempDir dir("settings");

  expect_throws<IOError>([&] { (void)load_settings_file(dir.file("missing.conf")); },
                         "load: missing file throws IOError");

  const std::string path = dir.file("glint.conf");
  write_file(path, "log_file = " + dir.file("app.log") + "\nuse_console_colors = off\n");
  LoggerSettings s;
  expect_no_throw([&] { s = load_settings_file(path); }, "load: valid file");
  expect_eq_str(s.log_file, dir.file("app.log"), "load: log_file applied");
  expect_true(!s.use_console_colors, "load: use_console_colors applied");
  expect_true(s.log_to_console, "load: unspecified keys keep defaults");

  write_file(path, "log_format = {bogus}\n");
  expect_throws<ConfigError>([&] { (void)load_settings_file(path); }, "load: invalid template rejected");
}

}  // namespace
}  // namespace glint

int main() {
  using namespace glint;

  test_level_names();
  test_color_names_and_codes();
  test_defaults();
  test_color_lookup_and_validation();
  test_apply_settings_text();
  test_settings_text_errors();
  test_settings_text_round_trip();
  test_load_settings_file();

  return selftest::finish();
}
