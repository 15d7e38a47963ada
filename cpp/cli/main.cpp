/*
================================================================================
CLI: Main Entry Point (glint_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line harness around the process-wide logger.
  - Lets scripts emit one log line with the same formatting, colors, file
    sink and fatal handling an application would get.

Usage:
  glint_cli [command] [options]

Commands:
  log <LEVEL> <message> [options]   Log one message with the default logger
  levels                            List levels and their default colors
  check-config <path>               Load and validate a settings file
  help                              Show help message

Hardening:
  - Explicit exit codes per error category for CI integration
  - No silent failures
================================================================================
*/

#include "glint/core/errors.hpp"
#include "glint/log/level.hpp"
#include "glint/log/logging.hpp"
#include "glint/log/settings.hpp"
#include "glint/log/settings_io.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>

using namespace glint;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  CONFIG_ERROR = 2,
  FATAL_RAISED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
glint_cli - synchronous console/file logger

Usage:
  glint_cli [command] [options]

Commands:
  log <LEVEL> <message>   Log one message (LEVEL: INFO, WARN, ERROR, FATAL,
                          SUCCESS, DEBUG, NETWORK)
  levels                  List levels and their default console colors
  check-config <path>     Load and validate a settings file
  help                    Show this help message

Options for 'log' (applied after --config, in order):
  --config <path>         Load settings from a key = value file
  --file <path>           Append raw messages to <path>
  --format <template>     Console template, e.g. "{timestamp} [{level}] {message}"
  --no-file               Disable the file sink
  --no-console            Disable the console sink
  --no-color              Disable console colors
  --no-fatal-screen       Print FATAL as a normal line, no key wait
  --no-fatal-throw        Do not treat FATAL as a failure

Examples:
  glint_cli log WARN "disk low"
  glint_cli log INFO "started" --no-file --format "[{level}] {message}"
  glint_cli check-config glint.conf

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Configuration error
  3 - Fatal error raised
  4 - I/O error
)";
}

struct LogArgs {
  Level level = Level::INFO;
  std::string message;
  std::optional<std::string> config_path;
  std::optional<std::string> file;
  std::optional<std::string> format;
  bool no_file = false;
  bool no_console = false;
  bool no_color = false;
  bool no_fatal_screen = false;
  bool no_fatal_throw = false;
};

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

// argv[2] = level, argv[3] = message, options follow.
static bool parse_log_args(int argc, char** argv, LogArgs* a, std::string* err) {
  if (argc < 4) {
    *err = "log requires <LEVEL> and <message>";
    return false;
  }
  try {
    a->level = parse_level(argv[2]);
  } catch (const ConfigError& e) {
    *err = e.what();
    return false;
  }
  a->message = argv[3];

  for (int i = 4; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--config") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--config requires a value"; return false; }
      a->config_path = v;
    } else if (std::strcmp(k, "--file") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--file requires a value"; return false; }
      a->file = v;
    } else if (std::strcmp(k, "--format") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--format requires a value"; return false; }
      a->format = v;
    } else if (std::strcmp(k, "--no-file") == 0) {
      a->no_file = true;
    } else if (std::strcmp(k, "--no-console") == 0) {
      a->no_console = true;
    } else if (std::strcmp(k, "--no-color") == 0) {
      a->no_color = true;
    } else if (std::strcmp(k, "--no-fatal-screen") == 0) {
      a->no_fatal_screen = true;
    } else if (std::strcmp(k, "--no-fatal-throw") == 0) {
      a->no_fatal_throw = true;
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

static void apply_overrides(const LogArgs& a, LoggerSettings& s) {
  if (a.file) {
    s.log_file = *a.file;
    s.log_to_file = true;
  }
  if (a.format) s.log_format = *a.format;
  if (a.no_file) s.log_to_file = false;
  if (a.no_console) s.log_to_console = false;
  if (a.no_color) s.use_console_colors = false;
  if (a.no_fatal_screen) s.show_fatal_error_screen = false;
  if (a.no_fatal_throw) s.fatal_log_throws_on_error = false;
}

int cmd_log(int argc, char** argv) {
  try {
    LogArgs args;
    std::string err;
    if (!parse_log_args(argc, argv, &args, &err)) {
      std::cerr << "Error: " << err << "\n";
      std::cerr << "Run 'glint_cli help' for usage information.\n";
      return ExitCode::INVALID_ARGS;
    }

    LoggerSettings& s = settings();
    if (args.config_path) s = load_settings_file(*args.config_path);
    apply_overrides(args, s);
    s.validate_or_throw();

    glint::log(args.message, args.level);
    return ExitCode::SUCCESS;

  } catch (const FatalError& e) {
    std::cerr << e.what() << "\n";
    return ExitCode::FATAL_RAISED;
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return ExitCode::CONFIG_ERROR;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  }
}

int cmd_levels() {
  const LevelColorTable colors = default_level_colors();
  for (Level lvl : kAllLevels) {
    std::cout << to_string(lvl) << "\t" << to_string(colors.at(lvl));
    if (lvl == Level::DEBUG) std::cout << "\t(only while a debugger is attached)";
    std::cout << "\n";
  }
  return ExitCode::SUCCESS;
}

int cmd_check_config(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Error: check-config requires <path>\n";
    return ExitCode::INVALID_ARGS;
  }

  try {
    const LoggerSettings s = load_settings_file(argv[2]);
    std::cout << settings_to_text(s);
    std::cout << "\nValidation: PASSED\n";
    return ExitCode::SUCCESS;

  } catch (const ConfigError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::CONFIG_ERROR;
  } catch (const IOError& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  }
}

int main(int argc, char** argv) {
  // Parse command
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd == "log") {
    return cmd_log(argc, argv);
  }

  if (cmd == "levels") {
    return cmd_levels();
  }

  if (cmd == "check-config") {
    return cmd_check_config(argc, argv);
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'glint_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
