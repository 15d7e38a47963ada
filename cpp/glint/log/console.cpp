#include "glint/log/console.hpp"

#include <cerrno>
#include <iostream>
#include <istream>
#include <ostream>

#if !defined(_WIN32)
#include <termios.h>
#include <unistd.h>
#endif

namespace glint {

namespace {

#if !defined(_WIN32)
// Reads one byte from a terminal with canonical mode and echo switched off.
// Returns false if fd is not a terminal.
bool read_raw_key(int fd) {
  if (!::isatty(fd)) return false;

  termios saved{};
  if (::tcgetattr(fd, &saved) != 0) return false;

  termios raw = saved;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(fd, TCSANOW, &raw) != 0) return false;

  char ch = 0;
  ssize_t n = 0;
  do {
    n = ::read(fd, &ch, 1);
  } while (n < 0 && errno == EINTR);

  // Restore is best effort: a failure leaves the terminal in raw mode and
  // there is nothing better to fall back to.
  (void)::tcsetattr(fd, TCSANOW, &saved);
  return true;
}
#endif

} // namespace

AnsiConsole::AnsiConsole(std::ostream& out, std::istream& in, int input_fd, bool styled)
    : out_(out), in_(in), input_fd_(input_fd), styled_(styled) {}

void AnsiConsole::set_foreground(Color c) {
  if (!styled_) return;
  out_ << "\033[" << ansi_foreground_code(c) << "m";
}

void AnsiConsole::set_background(Color c) {
  if (!styled_) return;
  out_ << "\033[" << ansi_background_code(c) << "m";
}

void AnsiConsole::reset_color() {
  if (!styled_) return;
  out_ << "\033[0m";
  out_.flush();
}

void AnsiConsole::clear() {
  if (!styled_) return;
  // Erase display, cursor home.
  out_ << "\033[2J\033[H";
}

void AnsiConsole::write_line(std::string_view text) {
  out_ << text << "\n";
  out_.flush();
}

void AnsiConsole::wait_for_key() {
  out_.flush();
#if !defined(_WIN32)
  if (input_fd_ >= 0 && read_raw_key(input_fd_)) return;
#endif
  in_.get();
}

Console& stdio_console() {
#if defined(_WIN32)
  static AnsiConsole console(std::cout, std::cin);
#else
  static AnsiConsole console(std::cout, std::cin, STDIN_FILENO, ::isatty(STDOUT_FILENO) != 0);
#endif
  return console;
}

} // namespace glint
