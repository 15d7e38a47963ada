#pragma once
/*
================================================================================
Log: Message Templates
FILE: cpp/glint/log/format.hpp

Purpose:
  - Compile the user's log format string once into segments.
  - Render (timestamp, level, message) into one console line.

Template language:
  {timestamp} or {0}          call time, "%Y-%m-%d %H:%M:%S.%f"
  {timestamp:<pattern>}       call time, strftime pattern; %f = milliseconds
  {level}     or {1}          symbolic level name
  {message}   or {2}          message, verbatim
  {{  }}                      literal braces

Hardening:
  - compile() rejects unknown placeholders and unbalanced braces with
    ConfigError, so a bad template fails on first use instead of printing junk.
  - Timestamps are local time, truncated (not rounded) to milliseconds.
================================================================================
*/

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "glint/log/level.hpp"

namespace glint {

using Clock = std::chrono::system_clock;

inline constexpr const char* kDefaultTimestampPattern = "%Y-%m-%d %H:%M:%S.%f";
inline constexpr const char* kDefaultLogFormat = "{timestamp} [{level}] {message}";

// Renders tp in local time using a strftime pattern extended with %f.
std::string format_timestamp(Clock::time_point tp,
                             std::string_view pattern = kDefaultTimestampPattern);

class LogTemplate {
 public:
  LogTemplate() = default;

  // Throws ConfigError on malformed templates.
  static LogTemplate compile(std::string_view text);

  std::string render(Clock::time_point tp, Level lvl, std::string_view message) const;

  const std::string& source() const noexcept { return source_; }

 private:
  enum class Field { kLiteral, kTimestamp, kLevel, kMessage };

  struct Segment {
    Field field = Field::kLiteral;
    std::string text;  // literal text, or the timestamp pattern
  };

  void push_literal(std::string_view s);

  std::string source_;
  std::vector<Segment> segments_;
};

// Convenience: compile + render in one go.
std::string format_message(std::string_view log_format,
                           Clock::time_point tp,
                           Level lvl,
                           std::string_view message);

} // namespace glint
