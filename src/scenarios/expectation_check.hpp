#pragma once

#include "probe/probe.hpp"
#include "scenarios/scenario.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace probekit::scenarios {

// Outcome of comparing one response against its expectation.
//
// `failures` lists every violated check in fixed evaluation order:
// 1) exact status
// 2) status range
// 3) required body substrings (declaration order)
// 4) forbidden body substrings (declaration order)
// 5) header values (sorted by header name)
// 6) headers that must be absent (declaration order)
// 7) max duration
struct ExpectationVerdict {
  bool passed = true;
  std::vector<std::string> failures;

  // All failure reasons joined with "; ". Empty when passed.
  std::string Message() const;
};

// Pure check; the same inputs always produce the same verdict and message.
ExpectationVerdict CheckExpectation(const Expectation& expectation,
                                    const probe::ProbeResponse& response,
                                    std::chrono::microseconds latency);

// Default verdict for duration-mode targets with no expectation: the call
// succeeded when the status code is in [200, 399].
ExpectationVerdict CheckDefaultSuccess(const probe::ProbeResponse& response);

// Header lookup with HTTP semantics (case-insensitive name). Returns nullptr
// when absent.
const std::string* FindHeader(const probe::HeaderMap& headers, const std::string& name);

} // namespace probekit::scenarios
