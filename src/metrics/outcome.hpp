#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace probekit::metrics {

// Result of exactly one invocation. In batch mode it also carries the
// scenario identity so report writers can render it without the input list.
struct InvocationOutcome {
  std::string scenario_id;
  std::string scenario_name;
  std::string category;
  std::string severity;
  bool success = false;
  int actual_status = 0;
  std::optional<int> expected_status;
  std::chrono::microseconds latency{0};
  std::optional<std::string> error;
  std::optional<std::string> response_body;
  std::chrono::system_clock::time_point finished_at{};
};

} // namespace probekit::metrics
