#pragma once

#include "metrics/outcome.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace probekit::metrics {

// Aggregate summary of one run.
//
// Invariants:
// - success + fail == total
// - p50_ms <= p95_ms <= p99_ms
// - every field is zero when total == 0
struct ExecutionMetrics {
  std::uint64_t total = 0;
  std::uint64_t success = 0;
  std::uint64_t fail = 0;
  double success_rate = 0.0; // percent, 0-100
  double avg_latency_ms = 0.0;
  double min_latency_ms = 0.0;
  double max_latency_ms = 0.0;
  double p50_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  // Completed invocations per second over the measured window. Zero when no
  // window was supplied.
  double rps = 0.0;
};

// Nearest-lower-rank percentile over an ascending sample: the value at index
// floor(count * percentile / 100), clamped to the last element. Returns 0 for
// an empty sample.
double PercentileFromSorted(const std::vector<double>& sorted_ms, double percentile);

// Pure reducer. `window` is the wall-clock span the outcomes were produced in
// and only feeds `rps`; pass zero when throughput is meaningless (batch mode).
ExecutionMetrics FinalizeMetrics(const std::vector<InvocationOutcome>& outcomes,
                                 std::chrono::microseconds window = std::chrono::microseconds{0});

} // namespace probekit::metrics
