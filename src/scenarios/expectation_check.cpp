#include "scenarios/expectation_check.hpp"

#include <algorithm>
#include <cctype>

namespace probekit::scenarios {

namespace {

bool EqualsIgnoreCase(const std::string& lhs, const std::string& rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
           return std::tolower(a) == std::tolower(b);
         });
}

std::uint64_t WholeMillis(std::chrono::microseconds latency) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(latency).count();
  return ms < 0 ? 0U : static_cast<std::uint64_t>(ms);
}

} // namespace

std::string ExpectationVerdict::Message() const {
  std::string joined;
  for (const auto& failure : failures) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += failure;
  }
  return joined;
}

const std::string* FindHeader(const probe::HeaderMap& headers, const std::string& name) {
  const auto exact = headers.find(name);
  if (exact != headers.end()) {
    return &exact->second;
  }
  for (const auto& [key, value] : headers) {
    if (EqualsIgnoreCase(key, name)) {
      return &value;
    }
  }
  return nullptr;
}

ExpectationVerdict CheckExpectation(const Expectation& expectation,
                                    const probe::ProbeResponse& response,
                                    const std::chrono::microseconds latency) {
  ExpectationVerdict verdict;
  const int status = response.status_code;

  if (expectation.status_code.has_value() && expectation.status_code.value() != 0 &&
      expectation.status_code.value() != status) {
    verdict.failures.push_back("status code mismatch: expected " +
                               std::to_string(expectation.status_code.value()) + ", got " +
                               std::to_string(status));
  }

  if (expectation.status_code_range.has_value()) {
    const StatusCodeRange& range = expectation.status_code_range.value();
    if (status < range.min || status > range.max) {
      verdict.failures.push_back("status code " + std::to_string(status) + " out of range [" +
                                 std::to_string(range.min) + "-" + std::to_string(range.max) +
                                 "]");
    }
  }

  for (const auto& needle : expectation.body_contains) {
    if (response.body.find(needle) == std::string::npos) {
      verdict.failures.push_back("body missing expected string: '" + needle + "'");
    }
  }

  for (const auto& needle : expectation.body_not_contains) {
    if (response.body.find(needle) != std::string::npos) {
      verdict.failures.push_back("body contains forbidden string: '" + needle + "'");
    }
  }

  for (const auto& [name, expected_value] : expectation.header_contains) {
    const std::string* actual = FindHeader(response.headers, name);
    if (actual == nullptr) {
      verdict.failures.push_back("header '" + name + "' not found");
    } else if (actual->find(expected_value) == std::string::npos) {
      verdict.failures.push_back("header '" + name + "': expected to contain '" +
                                 expected_value + "', got '" + *actual + "'");
    }
  }

  for (const auto& name : expectation.headers_not_present) {
    if (FindHeader(response.headers, name) != nullptr) {
      verdict.failures.push_back("header '" + name + "' should not be present");
    }
  }

  if (expectation.max_duration_ms.has_value() && expectation.max_duration_ms.value() > 0U) {
    const std::uint64_t elapsed_ms = WholeMillis(latency);
    if (elapsed_ms > expectation.max_duration_ms.value()) {
      verdict.failures.push_back("response time " + std::to_string(elapsed_ms) +
                                 "ms exceeded max " +
                                 std::to_string(expectation.max_duration_ms.value()) + "ms");
    }
  }

  verdict.passed = verdict.failures.empty();
  return verdict;
}

ExpectationVerdict CheckDefaultSuccess(const probe::ProbeResponse& response) {
  ExpectationVerdict verdict;
  if (response.status_code < 200 || response.status_code > 399) {
    verdict.passed = false;
    verdict.failures.push_back("unexpected status code " + std::to_string(response.status_code));
  }
  return verdict;
}

} // namespace probekit::scenarios
