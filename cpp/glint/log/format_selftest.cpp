/*
  Log format selftest

  Checks the template compiler and timestamp rendering:
    1) {timestamp} renders local time with millisecond precision.
    2) Named and positional placeholders, patterns and brace escapes.
    3) Malformed templates are rejected with ConfigError.

  Non-zero return code indicates failure.
*/

#include <chrono>
#include <ctime>
#include <string>

#include "glint/core/errors.hpp"
#include "glint/log/format.hpp"
#include "glint/testing/selftest.hpp"

namespace glint {
namespace {

using namespace glint::selftest;

// 2024-03-05 14:07:09 local time + ms milliseconds.
Clock::time_point local_time_point(int ms) {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 2;
  tm.tm_mday = 5;
  tm.tm_hour = 14;
  tm.tm_min = 7;
  tm.tm_sec = 9;
  tm.tm_isdst = -1;
  return Clock::from_time_t(std::mktime(&tm)) + std::chrono::milliseconds(ms);
}

void test_timestamp_default_pattern() {
  expect_eq_str(format_timestamp(local_time_point(123)), "2024-03-05 14:07:09.123",
                "timestamp: default pattern has millisecond precision");
  expect_eq_str(format_timestamp(local_time_point(7)), "2024-03-05 14:07:09.007",
                "timestamp: milliseconds are zero padded");
  expect_eq_str(format_timestamp(local_time_point(0)), "2024-03-05 14:07:09.000",
                "timestamp: whole second renders .000");
}

void test_timestamp_truncates_sub_millisecond() {
  const auto tp = local_time_point(999) + std::chrono::microseconds(999);
  expect_eq_str(format_timestamp(tp), "2024-03-05 14:07:09.999",
                "timestamp: sub-millisecond part is truncated, not rounded");
}

void test_timestamp_custom_patterns() {
  const auto tp = local_time_point(42);
  expect_eq_str(format_timestamp(tp, "%H:%M:%S"), "14:07:09", "timestamp: strftime pattern");
  expect_eq_str(format_timestamp(tp, "%f"), "042", "timestamp: %f alone");
  expect_eq_str(format_timestamp(tp, "100%%f"), "100%f", "timestamp: %%f stays literal");
  expect_eq_str(format_timestamp(tp, ""), "", "timestamp: empty pattern");
}

void test_named_placeholders() {
  const auto tp = local_time_point(123);
  const auto t = LogTemplate::compile(kDefaultLogFormat);
  expect_eq_str(t.render(tp, Level::WARN, "disk low"),
                "2024-03-05 14:07:09.123 [WARN] disk low",
                "template: default format");
  expect_eq_str(t.source(), kDefaultLogFormat, "template: keeps its source text");
}

void test_positional_placeholders() {
  const auto tp = local_time_point(123);
  expect_eq_str(format_message("{0:%H:%M} {1}: {2}", tp, Level::ERROR, "boom"),
                "14:07 ERROR: boom", "template: positional aliases with a pattern");
  expect_eq_str(format_message("{2}|{2}", tp, Level::INFO, "x"), "x|x",
                "template: placeholder may repeat");
}

void test_literals_and_escapes() {
  const auto tp = local_time_point(0);
  expect_eq_str(format_message("{{{level}}}", tp, Level::INFO, ""), "{INFO}",
                "template: doubled braces are literal");
  expect_eq_str(format_message("static text", tp, Level::INFO, "ignored"), "static text",
                "template: no placeholders");
  expect_eq_str(format_message("{message}", tp, Level::NETWORK, "{not a placeholder}"),
                "{not a placeholder}", "template: message rendered verbatim");
  expect_eq_str(format_message("[{level}] {message}", tp, Level::SUCCESS, ""), "[SUCCESS] ",
                "template: empty message");
  expect_eq_str(format_message("", tp, Level::INFO, "m"), "", "template: empty template");
}

void test_every_level_name() {
  const auto tp = local_time_point(0);
  const auto t = LogTemplate::compile("{level}");
  const char* expected[] = {"INFO", "WARN", "ERROR", "FATAL", "SUCCESS", "DEBUG", "NETWORK"};
  for (size_t i = 0; i < kAllLevels.size(); ++i) {
    expect_eq_str(t.render(tp, kAllLevels[i], ""), expected[i], std::string("template: level ") + expected[i]);
  }
}

void test_malformed_templates() {
  const char* bad[] = {
    "{nope}",
    "{level",
    "oops}",
    "{level:%H}",
    "{message:x}",
    "{{level}",
    "{tim{estamp}",
    "{}",
  };
  for (const char* b : bad) {
    expect_throws<ConfigError>([&] { (void)LogTemplate::compile(b); },
                               std::string("template: rejects \"") + b + "\"");
  }
}

}  // namespace
}  // namespace glint

int main() {
  using namespace glint;

  test_timestamp_default_pattern();
  test_timestamp_truncates_sub_millisecond();
  test_timestamp_custom_patterns();
  test_named_placeholders();
  test_positional_placeholders();
  test_literals_and_escapes();
  test_every_level_name();
  test_malformed_templates();

  return selftest::finish();
}
