#pragma once
/*
  Selftest helpers

  Framework-free expectations shared by the *_selftest executables.
  Each expectation prints "[ OK ]" or "[FAIL]" to stderr; finish() turns the
  failure count into the process exit code (non-zero = failure).
*/

#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace glint::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Runs f and expects it to throw E. Returns the caught what() ("" otherwise).
template <class E, class F>
std::string expect_throws(F&& f, std::string_view msg) {
  try {
    f();
  } catch (const E& e) {
    pass(msg);
    return e.what();
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw a different exception: " << e.what() << "\n";
    return {};
  }
  fail(msg);
  std::cerr << "  nothing was thrown\n";
  return {};
}

template <class F>
void expect_no_throw(F&& f, std::string_view msg) {
  try {
    f();
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw: " << e.what() << "\n";
  }
}

inline int finish() {
  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

} // namespace glint::selftest
