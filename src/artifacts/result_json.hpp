#pragma once

#include "metrics/execution_metrics.hpp"
#include "metrics/outcome.hpp"
#include "runner/batch_runner.hpp"
#include "runner/load_runner.hpp"

#include <chrono>
#include <string>

namespace probekit::artifacts {

// Run identity shared by both report shapes.
struct RunHeader {
  std::string run_id;
  std::string kind; // "batch" | "load"
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// Canonical, fixed-key-order JSON for report writers. Latencies are emitted in
// milliseconds with three decimals, rates with two.
std::string ToJson(const metrics::ExecutionMetrics& metrics);
std::string ToJson(const metrics::InvocationOutcome& outcome);

std::string BatchReportJson(const RunHeader& header, const runner::BatchRunResult& result);
std::string LoadReportJson(const RunHeader& header, const runner::LoadRunResult& result);

} // namespace probekit::artifacts
