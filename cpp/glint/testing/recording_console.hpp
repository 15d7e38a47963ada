#pragma once
// Test double for Console: records every call as a short event string
// ("fg:Yellow", "line:hello", "wait", ...) and never blocks.

#include <string>
#include <string_view>
#include <vector>

#include "glint/log/console.hpp"

namespace glint::selftest {

class RecordingConsole final : public Console {
 public:
  void set_foreground(Color c) override { events.push_back(std::string("fg:") + to_string(c)); }
  void set_background(Color c) override { events.push_back(std::string("bg:") + to_string(c)); }
  void reset_color() override { events.push_back("reset"); }
  void clear() override { events.push_back("clear"); }
  void write_line(std::string_view text) override {
    events.push_back("line:" + std::string(text));
    lines.emplace_back(text);
  }
  void wait_for_key() override { events.push_back("wait"); }

  void reset() {
    events.clear();
    lines.clear();
  }

  std::vector<std::string> events;
  std::vector<std::string> lines;
};

} // namespace glint::selftest
