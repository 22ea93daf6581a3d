#pragma once

#include "probe/probe.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace probekit::scenarios {

// Inclusive status code window.
struct StatusCodeRange {
  int min = 0;
  int max = 0;
};

// Declarative response expectation. Every field is optional; an empty
// expectation accepts any completed call.
struct Expectation {
  std::optional<int> status_code;
  std::optional<StatusCodeRange> status_code_range;
  std::vector<std::string> body_contains;
  std::vector<std::string> body_not_contains;
  // Header name -> substring the value must contain. Names match case-insensitively.
  std::map<std::string, std::string> header_contains;
  std::vector<std::string> headers_not_present;
  std::optional<std::uint64_t> max_duration_ms;

  bool empty() const {
    return !status_code.has_value() && !status_code_range.has_value() && body_contains.empty() &&
           body_not_contains.empty() && header_contains.empty() && headers_not_present.empty() &&
           !max_duration_ms.has_value();
  }
};

// One request + expectation pair executed once in batch mode. Treated as
// immutable once handed to a runner.
struct ScenarioDescriptor {
  std::string id;
  std::string name;
  std::string category;
  std::string severity;
  probe::ProbeRequest request;
  Expectation expectation;
};

// One entry of the rotating target set used by virtual users. Without an
// expectation a call counts as successful when it completes with a status in
// [200, 399].
struct TargetDescriptor {
  probe::ProbeRequest request;
  std::optional<Expectation> expectation;
};

// Stable label used as the outcome id in duration mode, e.g. "GET /health".
inline std::string TargetLabel(const TargetDescriptor& target) {
  return target.request.method + " " + target.request.target;
}

} // namespace probekit::scenarios
