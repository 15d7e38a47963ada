#pragma once
/*
================================================================================
Log: Console Abstraction
FILE: cpp/glint/log/console.hpp

Purpose:
  - The logger talks to a Console, never to std::cout directly, so tests and
    non-interactive services can substitute their own.
  - wait_for_key() is the acknowledgement step of the fatal error screen; a
    service can make it a no-op.

AnsiConsole:
  - Writes SGR color / clear sequences to an std::ostream.
  - wait_for_key() reads one key without waiting for Enter when input_fd is a
    terminal, otherwise one character from the std::istream.
  - With styled == false the color and clear calls write nothing, so
    redirected output holds only the text lines.
================================================================================
*/

#include <iosfwd>
#include <string_view>

#include "glint/log/color.hpp"

namespace glint {

class Console {
 public:
  virtual ~Console() = default;

  virtual void set_foreground(Color c) = 0;
  virtual void set_background(Color c) = 0;
  virtual void reset_color() = 0;
  virtual void clear() = 0;

  // Writes text followed by a newline.
  virtual void write_line(std::string_view text) = 0;

  // Blocks until one key press (or end of input).
  virtual void wait_for_key() = 0;
};

class AnsiConsole final : public Console {
 public:
  // input_fd < 0 disables raw single-key reads.
  AnsiConsole(std::ostream& out, std::istream& in, int input_fd = -1, bool styled = true);

  void set_foreground(Color c) override;
  void set_background(Color c) override;
  void reset_color() override;
  void clear() override;
  void write_line(std::string_view text) override;
  void wait_for_key() override;

 private:
  std::ostream& out_;
  std::istream& in_;
  int input_fd_;
  bool styled_;
};

// AnsiConsole bound to std::cout / std::cin; styled only if stdout is a terminal.
Console& stdio_console();

} // namespace glint
