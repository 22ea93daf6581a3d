#pragma once

#include "metrics/execution_metrics.hpp"
#include "metrics/outcome.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace probekit::metrics {

// Thread-safe accumulator for per-invocation outcomes.
//
// Lifecycle:
// - any number of workers call Record concurrently; every call is serialized
//   behind one mutex so outcomes are never lost or torn
// - once all producers have joined, the owner calls Finalize exactly once
// - Record after Finalize has started is rejected
class ResultCollector {
public:
  ResultCollector() = default;

  ResultCollector(const ResultCollector&) = delete;
  ResultCollector& operator=(const ResultCollector&) = delete;

  bool Record(InvocationOutcome outcome, std::string& error);

  std::size_t size() const;

  // Reduces everything recorded so far into metrics and seals the collector.
  bool Finalize(std::chrono::microseconds window, ExecutionMetrics& metrics, std::string& error);

  // Moves the raw outcomes out. Only valid after Finalize; arrival order.
  std::vector<InvocationOutcome> TakeOutcomes();

private:
  mutable std::mutex mu_;
  std::vector<InvocationOutcome> outcomes_;
  bool finalized_ = false;
};

} // namespace probekit::metrics
