/*
  Fragment 1.7 — Core: Selftest Helpers

  Framework-free assertions shared by the *_selftest executables.
  Each check prints one line to stderr:
      [ OK ] <what>
      [FAIL] <what>
  finish() prints the summary and returns the process exit code
  (non-zero when any check failed), so CTest only needs the return value.
*/

#pragma once

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace mcda::selftest {

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

inline void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << a << "  want: " << b << "  tol: " << tol << "\n";
  } else {
    pass(msg);
  }
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

// Runs `f`, expecting McdaError with `code`.
template <typename F>
void expect_throws_code(F&& f, ErrorCode code, std::string_view msg) {
  try {
    f();
  } catch (const McdaError& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  threw " << to_string(e.code()) << ": " << e.what() << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw non-McdaError: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  did not throw\n";
}

// Runs `f`, expecting no exception.
template <typename F>
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

}  // namespace mcda::selftest
