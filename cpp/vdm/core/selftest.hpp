#pragma once
/*
  Fragment 1.7 - Core: Selftest Helpers

  Framework-free expectations shared by the *_selftest executables.
  Each check prints "[ OK ]" or "[FAIL]" to stderr; the executable returns
  selftest::exit_code() so CTest sees a non-zero status on any failure.
*/

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace vdm::selftest {

inline int& fail_count() {
  static int n = 0;
  return n;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

// Expect fn() to throw exactly E (or a subclass).
template <class E, class Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw a different exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  nothing was thrown\n";
}

// Run one named case; an escaping exception counts as a failure.
template <class Fn>
void run_case(std::string_view name, Fn&& fn) {
  std::cerr << "--- " << name << "\n";
  try {
    fn();
  } catch (const std::exception& e) {
    fail(std::string(name) + ": threw: " + e.what());
  }
}

inline int exit_code() {
  if (fail_count() > 0) {
    std::cerr << fail_count() << " check(s) failed\n";
    return 1;
  }
  std::cerr << "all checks passed\n";
  return 0;
}

}  // namespace vdm::selftest
