/*
  Logger selftest

  Drives Logger (and the process-wide facade) against a RecordingConsole and
  a scratch directory. Covers:
    1) Console line format, colors and the DEBUG gate.
    2) File sink: raw messages, append-only, call order.
    3) FATAL ordering: sinks written first, then the signal.
    4) Fatal screen replaces the console line and waits for a key.
    5) Error propagation: IOError, ConfigError.

  Non-zero return code indicates failure.
*/

#include <chrono>
#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include "glint/core/errors.hpp"
#include "glint/log/debugger.hpp"
#include "glint/log/format.hpp"
#include "glint/log/logger.hpp"
#include "glint/log/logging.hpp"
#include "glint/testing/recording_console.hpp"
#include "glint/testing/selftest.hpp"
#include "glint/testing/temp_dir.hpp"

namespace glint {
namespace {

using namespace glint::selftest;

// 2021-06-01 00:00:00 UTC + 250 ms
const Clock::time_point kFixedTime = Clock::from_time_t(1622505600) + std::chrono::milliseconds(250);

LoggerHooks fixed_hooks(bool debugger) {
  LoggerHooks h;
  h.debug_session_active = [debugger] { return debugger; };
  h.now = [] { return kFixedTime; };
  return h;
}

// File sink pointed into dir, fatal screen and fatal throw off.
LoggerSettings quiet_settings(const TempDir& dir) {
  LoggerSettings s;
  s.log_file = dir.file("app.log");
  s.show_fatal_error_screen = false;
  s.fatal_log_throws_on_error = false;
  return s;
}

std::string stamp() { return format_timestamp(kFixedTime); }

void expect_events(const RecordingConsole& c, const std::vector<std::string>& want, std::string_view msg) {
  if (c.events == want) {
    pass(msg);
    return;
  }
  fail(msg);
  std::cerr << "  got:";
  for (const auto& e : c.events) std::cerr << " [" << e << "]";
  std::cerr << "\n  want:";
  for (const auto& e : want) std::cerr << " [" << e << "]";
  std::cerr << "\n";
}

void test_console_line_with_colors() {
  TempDir dir("console");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_to_file = false;
  Logger logger(s, con, fixed_hooks(false));

  logger.warn("disk low");
  expect_events(con, {"fg:Yellow", "line:" + stamp() + " [WARN] disk low", "reset"},
                "console: color set, formatted line, color reset");

  con.reset();
  logger.settings().use_console_colors = false;
  logger.success("done");
  expect_events(con, {"line:" + stamp() + " [SUCCESS] done"}, "console: no color calls when colors are off");
}

void test_console_line_real_clock() {
  RecordingConsole con;
  LoggerSettings s;
  s.log_to_file = false;
  s.use_console_colors = false;
  LoggerHooks h;
  h.debug_session_active = [] { return false; };
  Logger logger(s, con, h);

  const auto before = std::chrono::floor<std::chrono::seconds>(Clock::now());
  logger.warn("disk low");
  const auto after = Clock::now();

  expect_true(con.lines.size() == 1, "real clock: one console line");
  if (con.lines.size() != 1) return;
  const std::string& line = con.lines[0];

  static const std::regex kShape(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[WARN\] disk low$)");
  expect_true(std::regex_match(line, kShape), "real clock: line is '<timestamp> [WARN] disk low'");

  // The second-resolution prefix must be the call time (before..after).
  const std::string prefix = line.substr(0, 19);
  bool in_window = false;
  for (auto t = before; t <= after; t += std::chrono::seconds(1)) {
    if (format_timestamp(t, "%Y-%m-%d %H:%M:%S") == prefix) in_window = true;
  }
  expect_true(in_window, "real clock: timestamp is the call time");
}

void test_debug_gate() {
  TempDir dir("debug");
  RecordingConsole con;
  Logger logger(quiet_settings(dir), con, fixed_hooks(false));

  const LogOutcome skipped = logger.emit("hidden", Level::DEBUG);
  expect_true(!skipped.emitted, "debug: filtered without a debugger");
  expect_true(con.events.empty(), "debug: no console output without a debugger");
  expect_true(!std::filesystem::exists(dir.file("app.log")), "debug: no file output without a debugger");

  logger.settings().log_format = "{bogus}";
  expect_no_throw([&] { logger.debug("x"); }, "debug: filtered before formatting");
  logger.settings().log_format = kDefaultLogFormat;

  logger.set_hooks(fixed_hooks(true));
  logger.debug("visible");
  expect_events(con, {"fg:DarkGray", "line:" + stamp() + " [DEBUG] visible", "reset"},
                "debug: logged like any level with a debugger");
  expect_eq_str(read_file(dir.file("app.log")), "visible\n", "debug: file written with a debugger");
}

// Selftests run without a tracer, so the OS probe must report "not attached"
// and a logger on default hooks must drop DEBUG.
void test_default_debugger_probe() {
  expect_true(!debugger_attached(), "debugger: probe reports no tracer under the test runner");

  RecordingConsole con;
  LoggerSettings s;
  s.log_to_file = false;
  Logger logger(s, con);
  expect_true(!logger.emit("hidden", Level::DEBUG).emitted, "debugger: default hooks filter DEBUG");
  expect_true(con.events.empty(), "debugger: default hooks produce no output for DEBUG");
}

void test_file_append_monotonic() {
  TempDir dir("append");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_to_console = false;
  write_file(s.log_file, "existing line\n");
  Logger logger(s, con, fixed_hooks(false));

  logger.info("first");
  logger.error("second");
  logger.network("");
  logger.info("third");

  expect_eq_str(read_file(s.log_file), "existing line\nfirst\nsecond\n\nthird\n",
                "file: raw messages appended in order, earlier lines kept");
  expect_true(con.events.empty(), "file: console untouched when log_to_console is off");

  TempDir fresh("create");
  logger.settings().log_file = fresh.file("new.log");
  logger.info("created");
  expect_eq_str(read_file(fresh.file("new.log")), "created\n", "file: missing file is created");
}

void test_fatal_throw_after_sinks() {
  TempDir dir("fatal");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.fatal_log_throws_on_error = true;
  s.use_console_colors = false;
  Logger logger(s, con, fixed_hooks(false));

  bool thrown = false;
  try {
    logger.fatal("reactor breach");
  } catch (const FatalError& e) {
    thrown = true;
    expect_eq_str(e.what(), "Fatal error: reactor breach", "fatal: error text");
    expect_eq_str(e.message(), "reactor breach", "fatal: raw message kept");
    expect_eq_str(read_file(s.log_file), "reactor breach\n", "fatal: file written before the throw");
    expect_events(con, {"line:" + stamp() + " [FATAL] reactor breach"},
                  "fatal: console line written before the throw");
  }
  expect_true(thrown, "fatal: FatalError raised");

  logger.settings().fatal_log_throws_on_error = false;
  expect_no_throw([&] { logger.fatal("tolerated"); }, "fatal: no throw when disabled");
}

void test_fatal_signal_value() {
  TempDir dir("signal");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.fatal_log_throws_on_error = true;
  Logger logger(s, con, fixed_hooks(false));

  const LogOutcome out = logger.emit("overheated", Level::FATAL);
  expect_true(out.emitted && !out.ok(), "signal: emit returns a fatal signal");
  if (out.fatal) {
    expect_eq_str(out.fatal->text(), "Fatal error: overheated", "signal: text");
    const std::string what = expect_throws<FatalError>([&] { out.fatal->raise(); }, "signal: raise throws FatalError");
    expect_eq_str(what, "Fatal error: overheated", "signal: raised text");
  }
  expect_true(logger.emit("fine", Level::ERROR).ok(), "signal: non-fatal levels never signal");
}

void test_fatal_screen() {
  TempDir dir("screen");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.show_fatal_error_screen = true;
  s.fatal_error_screen_color = Color::DarkBlue;
  Logger logger(s, con, fixed_hooks(false));

  logger.fatal("core dumped");
  const std::string formatted = stamp() + " [FATAL] core dumped";
  expect_events(con,
                {"bg:DarkBlue", "fg:White", "clear",
                 "line:>==== FATAL ERROR ====<",
                 "line:" + formatted,
                 "line:>==== FATAL ERROR ====<",
                 "line:Press any key to continue...",
                 "wait"},
                "screen: banner, prompt and key wait replace the console line");
  expect_eq_str(read_file(s.log_file), "core dumped\n", "screen: file still gets the raw message");

  con.reset();
  logger.settings().log_to_console = false;
  logger.settings().fatal_log_throws_on_error = true;
  expect_throws<FatalError>([&] { logger.fatal("again"); }, "screen: throw follows the screen");
  expect_true(con.events.size() == 8 && con.events.back() == "wait",
              "screen: shown even with log_to_console off");
}

void test_both_sinks_disabled() {
  TempDir dir("silent");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_to_console = false;
  s.log_to_file = false;
  Logger logger(s, con, fixed_hooks(true));

  for (Level lvl : kAllLevels) {
    if (lvl == Level::FATAL) continue;
    expect_no_throw([&] { logger.log("nothing", lvl); }, std::string("silent: returns normally for ") + to_string(lvl));
  }
  expect_true(con.events.empty(), "silent: no console I/O");
  expect_true(std::filesystem::is_empty(dir.path()), "silent: no file I/O");
}

void test_io_error_propagates() {
  TempDir dir("ioerr");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_file = dir.file("no/such/dir/app.log");
  s.fatal_log_throws_on_error = true;
  s.use_console_colors = false;
  Logger logger(s, con, fixed_hooks(false));

  std::string what = expect_throws<IOError>([&] { logger.info("lost"); }, "io: append failure throws IOError");
  expect_true(what.find("no/such/dir") != std::string::npos, "io: error names the path");
  expect_true(con.lines.size() == 1, "io: console was written before the failure");

  // The fatal signal must not replace the I/O error.
  expect_throws<IOError>([&] { logger.fatal("lost too"); }, "io: IOError wins over the fatal signal");
}

void test_missing_color_entry() {
  TempDir dir("colors");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.level_colors.erase(Level::WARN);
  Logger logger(s, con, fixed_hooks(false));

  expect_throws<ConfigError>([&] { logger.warn("w"); }, "colors: missing entry fails loudly");
  expect_true(con.lines.empty(), "colors: nothing printed on lookup failure");

  logger.settings().use_console_colors = false;
  expect_no_throw([&] { logger.warn("w"); }, "colors: table not read when colors are off");

  logger.settings().use_console_colors = true;
  logger.settings().show_fatal_error_screen = true;
  logger.settings().level_colors.clear();
  expect_no_throw([&] { logger.fatal("f"); }, "colors: fatal screen does not read the table");
}

void test_bad_template_fails_before_io() {
  TempDir dir("template");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_format = "{timestamp} {lvl} {message}";
  Logger logger(s, con, fixed_hooks(false));

  expect_throws<ConfigError>([&] { logger.info("x"); }, "template: bad format throws ConfigError");
  expect_true(con.events.empty() && !std::filesystem::exists(s.log_file), "template: no I/O on bad format");

  logger.settings().log_format = "{level}|{message}";
  logger.settings().use_console_colors = false;
  logger.info("x");
  expect_eq_str(con.lines.empty() ? std::string() : con.lines.back(), "INFO|x",
                "template: format change applies to the next call");
}

void test_wrappers_and_idempotence() {
  TempDir dir("wrappers");
  RecordingConsole con;
  LoggerSettings s = quiet_settings(dir);
  s.log_to_file = false;
  s.use_console_colors = false;
  s.log_format = "{level}:{message}";
  Logger logger(s, con, fixed_hooks(true));

  logger.info("m");
  logger.warn("m");
  logger.error("m");
  logger.fatal("m");
  logger.success("m");
  logger.debug("m");
  logger.network("m");
  const std::vector<std::string> want = {"INFO:m", "WARN:m", "ERROR:m", "FATAL:m",
                                         "SUCCESS:m", "DEBUG:m", "NETWORK:m"};
  expect_true(con.lines == want, "wrappers: each wrapper logs at its level");

  // Same configuration applied twice -> same output.
  con.reset();
  logger.settings() = s;
  logger.warn("again");
  logger.settings() = s;
  logger.warn("again");
  expect_true(con.lines.size() == 2 && con.lines[0] == con.lines[1],
              "idempotence: reapplying settings changes nothing");
}

void test_process_wide_facade() {
  TempDir dir("facade");
  RecordingConsole con;
  Logger& logger = default_logger();
  logger.set_console(con);
  logger.set_hooks(fixed_hooks(false));

  settings() = quiet_settings(dir);
  settings().use_console_colors = false;
  settings().log_format = "[{level}] {message}";
  expect_true(&settings() == &default_logger().settings(), "facade: settings() is the default logger's");

  warn("shared");
  debug("hidden");
  glint::log("direct", Level::NETWORK);
  expect_true(con.lines == std::vector<std::string>{"[WARN] shared", "[NETWORK] direct"},
              "facade: free functions use the default logger");
  expect_eq_str(read_file(settings().log_file), "shared\ndirect\n", "facade: file sink follows settings()");

  settings().log_to_console = false;
  info("quiet");
  expect_true(con.lines.size() == 2, "facade: settings changes apply process-wide");

  settings().fatal_log_throws_on_error = true;
  expect_throws<FatalError>([] { fatal("stop"); }, "facade: fatal throws");

  // Leave the default logger pointed at real resources.
  settings() = LoggerSettings::defaults();
  logger.set_console(stdio_console());
  logger.set_hooks({});
}

}  // namespace
}  // namespace glint

int main() {
  using namespace glint;

  test_console_line_with_colors();
  test_console_line_real_clock();
  test_debug_gate();
  test_default_debugger_probe();
  test_file_append_monotonic();
  test_fatal_throw_after_sinks();
  test_fatal_signal_value();
  test_fatal_screen();
  test_both_sinks_disabled();
  test_io_error_propagates();
  test_missing_color_entry();
  test_bad_template_fails_before_io();
  test_wrappers_and_idempotence();
  test_process_wide_facade();

  return selftest::finish();
}
