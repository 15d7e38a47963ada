#include "glint/log/logger.hpp"

#include <utility>

#include "glint/core/errors.hpp"
#include "glint/log/debugger.hpp"
#include "glint/log/file_sink.hpp"

namespace glint {

namespace {

constexpr const char* kFatalBanner = ">==== FATAL ERROR ====<";
constexpr const char* kFatalPrompt = "Press any key to continue...";

LoggerHooks with_defaults(LoggerHooks hooks) {
  if (!hooks.debug_session_active) hooks.debug_session_active = [] { return debugger_attached(); };
  if (!hooks.now) hooks.now = [] { return Clock::now(); };
  return hooks;
}

} // namespace

void FatalSignal::raise() const {
  throw FatalError(message_);
}

Logger::Logger() : Logger(LoggerSettings::defaults()) {}

Logger::Logger(LoggerSettings settings)
    : Logger(std::move(settings), stdio_console()) {}

Logger::Logger(LoggerSettings settings, Console& console, LoggerHooks hooks)
    : settings_(std::move(settings)),
      console_(&console),
      hooks_(with_defaults(std::move(hooks))) {}

void Logger::set_hooks(LoggerHooks hooks) {
  hooks_ = with_defaults(std::move(hooks));
}

const LogTemplate& Logger::current_template() {
  if (!template_ || template_->source() != settings_.log_format) {
    template_ = LogTemplate::compile(settings_.log_format);
  }
  return *template_;
}

void Logger::show_fatal_screen(const std::string& formatted) {
  Console& c = *console_;
  c.set_background(settings_.fatal_error_screen_color);
  c.set_foreground(Color::White);
  c.clear();

  c.write_line(kFatalBanner);
  c.write_line(formatted);
  c.write_line(kFatalBanner);

  c.write_line(kFatalPrompt);
  c.wait_for_key();
}

void Logger::write_console_line(const std::string& formatted, Level lvl) {
  Console& c = *console_;
  if (settings_.use_console_colors) c.set_foreground(settings_.color_for(lvl));

  c.write_line(formatted);

  if (settings_.use_console_colors) c.reset_color();
}

LogOutcome Logger::emit(std::string_view message, Level lvl) {
  LogOutcome outcome;

  if (lvl == Level::DEBUG && !hooks_.debug_session_active()) return outcome;

  const std::string formatted = current_template().render(hooks_.now(), lvl, message);

  if (lvl == Level::FATAL && settings_.show_fatal_error_screen) {
    show_fatal_screen(formatted);
  } else if (settings_.log_to_console) {
    write_console_line(formatted, lvl);
  }

  if (settings_.log_to_file) append_line(settings_.log_file, message);

  outcome.emitted = true;
  if (lvl == Level::FATAL && settings_.fatal_log_throws_on_error) {
    outcome.fatal.emplace(std::string(message));
  }
  return outcome;
}

void Logger::log(std::string_view message, Level lvl) {
  const LogOutcome outcome = emit(message, lvl);
  if (outcome.fatal) outcome.fatal->raise();
}

} // namespace glint
