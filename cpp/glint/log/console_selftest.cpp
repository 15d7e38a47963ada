/*
  Console selftest

  Runs the logger through AnsiConsole bound to string streams and checks the
  exact bytes a terminal would receive:
    1) Level color SGR, formatted line, reset.
    2) Fatal screen: background + white foreground, clear, banner, prompt,
       then exactly one character consumed by the key wait.
    3) Unstyled console (redirected output) writes text lines only.

  Non-zero return code indicates failure.
*/

#include <chrono>
#include <sstream>
#include <string>

#include "glint/log/console.hpp"
#include "glint/log/format.hpp"
#include "glint/log/logger.hpp"
#include "glint/testing/selftest.hpp"

namespace glint {
namespace {

using namespace glint::selftest;

const Clock::time_point kFixedTime = Clock::from_time_t(1622505600) + std::chrono::milliseconds(5);

LoggerHooks fixed_hooks() {
  LoggerHooks h;
  h.debug_session_active = [] { return false; };
  h.now = [] { return kFixedTime; };
  return h;
}

// Console only: no file sink, no fatal throw.
LoggerSettings console_settings() {
  LoggerSettings s;
  s.log_to_file = false;
  s.fatal_log_throws_on_error = false;
  return s;
}

std::string stamp() { return format_timestamp(kFixedTime); }

void test_colored_line_bytes() {
  std::ostringstream out;
  std::istringstream in("ab");
  AnsiConsole con(out, in);
  Logger logger(console_settings(), con, fixed_hooks());

  logger.warn("disk low");
  expect_eq_str(out.str(), "\033[93m" + stamp() + " [WARN] disk low\n\033[0m",
                "ansi: yellow foreground, line, reset");

  out.str("");
  logger.settings().level_colors[Level::INFO] = Color::DarkCyan;
  logger.info("up");
  expect_eq_str(out.str(), "\033[36m" + stamp() + " [INFO] up\n\033[0m",
                "ansi: color table change is honored");

  out.str("");
  logger.settings().use_console_colors = false;
  logger.error("plain");
  expect_eq_str(out.str(), stamp() + " [ERROR] plain\n", "ansi: no escape codes with colors off");
  expect_true(in.peek() == 'a', "ansi: console lines never read input");
}

void test_fatal_screen_bytes() {
  std::ostringstream out;
  std::istringstream in("ab");
  AnsiConsole con(out, in);
  Logger logger(console_settings(), con, fixed_hooks());

  logger.fatal("core dumped");
  const std::string want =
      "\033[41m\033[97m\033[2J\033[H"
      ">==== FATAL ERROR ====<\n" +
      stamp() + " [FATAL] core dumped\n"
      ">==== FATAL ERROR ====<\n"
      "Press any key to continue...\n";
  expect_eq_str(out.str(), want, "ansi: fatal screen background, clear, banner, prompt");
  expect_true(in.peek() == 'b', "ansi: key wait consumed exactly one character");

  out.str("");
  logger.settings().fatal_error_screen_color = Color::DarkBlue;
  logger.fatal("again");
  expect_true(out.str().compare(0, 5, "\033[44m") == 0, "ansi: fatal screen color is configurable");
  expect_true(in.peek() == std::char_traits<char>::eof(), "ansi: second key wait consumed the last character");
}

void test_unstyled_console() {
  std::ostringstream out;
  std::istringstream in("k");
  AnsiConsole con(out, in, -1, false);
  Logger logger(console_settings(), con, fixed_hooks());

  logger.warn("redirected");
  expect_eq_str(out.str(), stamp() + " [WARN] redirected\n", "unstyled: colored level writes text only");

  out.str("");
  logger.fatal("down");
  expect_eq_str(out.str(),
                ">==== FATAL ERROR ====<\n" + stamp() + " [FATAL] down\n"
                ">==== FATAL ERROR ====<\nPress any key to continue...\n",
                "unstyled: fatal screen without escape codes");
  expect_true(out.str().find('\033') == std::string::npos, "unstyled: no escape byte at all");
  expect_true(in.peek() == std::char_traits<char>::eof(), "unstyled: key wait still reads input");
}

}  // namespace
}  // namespace glint

int main() {
  using namespace glint;

  test_colored_line_bytes();
  test_fatal_screen_bytes();
  test_unstyled_console();

  return selftest::finish();
}
