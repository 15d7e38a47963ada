#include "glint/log/format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "glint/core/errors.hpp"

namespace glint {

namespace {

std::tm local_tm(std::time_t tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

std::string three_digits(long v) {
  std::string s(3, '0');
  s[0] = static_cast<char>('0' + (v / 100) % 10);
  s[1] = static_cast<char>('0' + (v / 10) % 10);
  s[2] = static_cast<char>('0' + v % 10);
  return s;
}

[[noreturn]] void bad_template(std::string_view text, size_t pos, const std::string& why) {
  std::ostringstream oss;
  oss << "invalid log format \"" << text << "\" at offset " << pos << ": " << why;
  throw ConfigError(oss.str());
}

} // namespace

std::string format_timestamp(Clock::time_point tp, std::string_view pattern) {
  const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  const long ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count());

  // Expand %f ourselves; strftime has no sub-second conversion.
  std::string expanded;
  expanded.reserve(pattern.size() + 8);
  for (size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '%' && i + 1 < pattern.size()) {
      const char n = pattern[i + 1];
      if (n == 'f') {
        expanded += three_digits(ms);
      } else {
        expanded += c;
        expanded += n;
      }
      ++i;
      continue;
    }
    expanded += c;
  }
  if (expanded.empty()) return expanded;

  const std::tm tm = local_tm(Clock::to_time_t(secs));
  std::ostringstream oss;
  oss << std::put_time(&tm, expanded.c_str());
  return oss.str();
}

void LogTemplate::push_literal(std::string_view s) {
  if (s.empty()) return;
  if (!segments_.empty() && segments_.back().field == Field::kLiteral) {
    segments_.back().text.append(s.data(), s.size());
    return;
  }
  segments_.push_back(Segment{Field::kLiteral, std::string(s)});
}

LogTemplate LogTemplate::compile(std::string_view text) {
  LogTemplate t;
  t.source_ = std::string(text);

  size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];

    if (c == '{') {
      if (i + 1 < text.size() && text[i + 1] == '{') {
        t.push_literal("{");
        i += 2;
        continue;
      }
      const size_t close = text.find('}', i + 1);
      if (close == std::string_view::npos) bad_template(text, i, "unbalanced '{'");

      const std::string_view inner = text.substr(i + 1, close - i - 1);
      if (inner.find('{') != std::string_view::npos) bad_template(text, i, "nested '{'");

      const size_t colon = inner.find(':');
      const std::string_view name = inner.substr(0, colon);
      const bool has_pattern = colon != std::string_view::npos;
      const std::string_view pattern =
          has_pattern ? inner.substr(colon + 1) : std::string_view{};

      if (name == "timestamp" || name == "0") {
        Segment s;
        s.field = Field::kTimestamp;
        s.text = (has_pattern && !pattern.empty()) ? std::string(pattern)
                                                  : std::string(kDefaultTimestampPattern);
        t.segments_.push_back(std::move(s));
      } else if (name == "level" || name == "1" || name == "message" || name == "2") {
        if (has_pattern) bad_template(text, i, "only {timestamp} accepts a pattern");
        Segment s;
        s.field = (name == "level" || name == "1") ? Field::kLevel : Field::kMessage;
        t.segments_.push_back(std::move(s));
      } else {
        bad_template(text, i, "unknown placeholder '{" + std::string(inner) + "}'");
      }
      i = close + 1;
      continue;
    }

    if (c == '}') {
      if (i + 1 < text.size() && text[i + 1] == '}') {
        t.push_literal("}");
        i += 2;
        continue;
      }
      bad_template(text, i, "unbalanced '}'");
    }

    // Run of plain characters up to the next brace.
    const size_t next = text.find_first_of("{}", i);
    const size_t end = (next == std::string_view::npos) ? text.size() : next;
    t.push_literal(text.substr(i, end - i));
    i = end;
  }

  return t;
}

std::string LogTemplate::render(Clock::time_point tp, Level lvl, std::string_view message) const {
  std::string out;
  out.reserve(source_.size() + message.size() + 32);
  for (const auto& s : segments_) {
    switch (s.field) {
      case Field::kLiteral:   out += s.text; break;
      case Field::kTimestamp: out += format_timestamp(tp, s.text); break;
      case Field::kLevel:     out += to_string(lvl); break;
      case Field::kMessage:   out.append(message.data(), message.size()); break;
    }
  }
  return out;
}

std::string format_message(std::string_view log_format,
                           Clock::time_point tp,
                           Level lvl,
                           std::string_view message) {
  return LogTemplate::compile(log_format).render(tp, lvl, message);
}

} // namespace glint
