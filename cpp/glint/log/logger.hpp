#pragma once
/*
================================================================================
Log: Logger
FILE: cpp/glint/log/logger.hpp

Purpose:
  - One Logger = one LoggerSettings + one Console + injectable hooks.
  - emit() formats a message and dispatches it to the configured sinks:
      1) FATAL + show_fatal_error_screen -> banner on the console, wait for key
      2) otherwise, log_to_console       -> one formatted (colored) line
      3) log_to_file                     -> raw message appended to log_file
      4) FATAL + fatal_log_throws_on_error -> FatalSignal in the outcome
  - log() and the level wrappers raise that signal as FatalError.

Notes:
  - DEBUG is dropped without any formatting or I/O unless
    hooks.debug_session_active() is true (default: debugger_attached()).
  - The file gets the raw message; only the console sees the template.
  - Errors from the sinks (IOError, ConfigError) propagate unchanged. When the
    file write fails, no FatalSignal is produced.
  - No internal locking. Concurrent callers must serialize emit() themselves,
    otherwise color sequences and appends may interleave.
================================================================================
*/

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "glint/log/console.hpp"
#include "glint/log/format.hpp"
#include "glint/log/level.hpp"
#include "glint/log/settings.hpp"

namespace glint {

struct LoggerHooks {
  // Gate for Level::DEBUG. Empty -> debugger_attached().
  std::function<bool()> debug_session_active;

  // Timestamp source. Empty -> Clock::now().
  std::function<Clock::time_point()> now;
};

// A FATAL log that asked to be propagated. Carried by value so the caller
// decides whether to raise it, exit, or drop it.
class FatalSignal {
 public:
  explicit FatalSignal(std::string message) : message_(std::move(message)) {}

  const std::string& message() const noexcept { return message_; }

  // "Fatal error: " + message
  std::string text() const { return "Fatal error: " + message_; }

  [[noreturn]] void raise() const;

 private:
  std::string message_;
};

struct LogOutcome {
  // False only when a DEBUG message was filtered out.
  bool emitted = false;

  std::optional<FatalSignal> fatal;

  bool ok() const noexcept { return !fatal.has_value(); }
};

class Logger {
 public:
  // Default settings on the stdio console.
  Logger();
  explicit Logger(LoggerSettings settings);
  Logger(LoggerSettings settings, Console& console, LoggerHooks hooks = {});

  LoggerSettings& settings() noexcept { return settings_; }
  const LoggerSettings& settings() const noexcept { return settings_; }

  void set_console(Console& console) noexcept { console_ = &console; }
  Console& console() const noexcept { return *console_; }

  void set_hooks(LoggerHooks hooks);

  LogOutcome emit(std::string_view message, Level lvl);

  // emit(), then raise the fatal signal if there is one.
  void log(std::string_view message, Level lvl);

  void info(std::string_view message) { log(message, Level::INFO); }
  void warn(std::string_view message) { log(message, Level::WARN); }
  void error(std::string_view message) { log(message, Level::ERROR); }
  // Throws FatalError if settings().fatal_log_throws_on_error.
  void fatal(std::string_view message) { log(message, Level::FATAL); }
  void success(std::string_view message) { log(message, Level::SUCCESS); }
  // No-op unless a debug session is active.
  void debug(std::string_view message) { log(message, Level::DEBUG); }
  void network(std::string_view message) { log(message, Level::NETWORK); }

 private:
  const LogTemplate& current_template();
  void show_fatal_screen(const std::string& formatted);
  void write_console_line(const std::string& formatted, Level lvl);

  LoggerSettings settings_;
  Console* console_;
  LoggerHooks hooks_;

  // Recompiled whenever settings_.log_format changes.
  std::optional<LogTemplate> template_;
};

} // namespace glint
