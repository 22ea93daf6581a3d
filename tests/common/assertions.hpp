#ifndef PROBEKIT_TESTS_COMMON_ASSERTIONS_HPP_
#define PROBEKIT_TESTS_COMMON_ASSERTIONS_HPP_

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace probekit::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNear(double actual, double expected, double tolerance, std::string_view what) {
  if (std::fabs(actual - expected) <= tolerance) {
    return;
  }
  std::cerr << what << ": expected " << expected << " +/- " << tolerance << ", got " << actual
            << '\n';
  std::abort();
}

} // namespace probekit::tests::common

#endif // PROBEKIT_TESTS_COMMON_ASSERTIONS_HPP_
