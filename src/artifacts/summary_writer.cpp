#include "artifacts/summary_writer.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace probekit::artifacts {

namespace {

std::string Ms(double value) {
  return core::FormatFixedDouble(value, 3) + "ms";
}

} // namespace

std::string FormatBatchSummary(const runner::BatchRunResult& result) {
  std::ostringstream out;
  out << "Test Results (" << result.outcomes.size() << " tests):\n\n";

  for (const auto& outcome : result.outcomes) {
    out << (outcome.success ? "PASS" : "FAIL") << " [" << outcome.category << "] "
        << outcome.scenario_name << " (" << Ms(core::ToMillis(outcome.latency)) << ")\n";
    if (outcome.success) {
      continue;
    }
    out << "  Error: " << outcome.error.value_or("unknown failure") << '\n';
    if (outcome.expected_status.has_value()) {
      out << "  Status: Expected " << outcome.expected_status.value() << ", Got "
          << outcome.actual_status << '\n';
    }
  }

  out << "\nSummary: " << result.metrics.success << " Passed, " << result.metrics.fail
      << " Failed";
  if (result.skipped > 0U) {
    out << ", " << result.skipped << " Skipped";
  }
  out << '\n';
  return out.str();
}

std::string FormatLoadSummary(const runner::LoadRunResult& result) {
  const metrics::ExecutionMetrics& m = result.metrics;
  std::ostringstream out;
  out << "Performance Test Complete (Mode: " << runner::ToString(result.mode) << ")\n\n"
      << "Virtual users: " << result.concurrency << ", duration: " << result.duration.count()
      << "ms, stopped by: " << runner::ToString(result.stop_cause) << "\n"
      << "Requests:   " << m.total << " total, " << m.success << " success, " << m.fail
      << " failed (" << core::FormatFixedDouble(m.success_rate, 2) << "% success rate)\n"
      << "Throughput: " << core::FormatFixedDouble(m.rps, 2) << " req/s\n"
      << "Latency:\n"
      << "  Avg: " << Ms(m.avg_latency_ms) << '\n'
      << "  Min: " << Ms(m.min_latency_ms) << '\n'
      << "  Max: " << Ms(m.max_latency_ms) << '\n'
      << "Percentiles:\n"
      << "  p50: " << Ms(m.p50_ms) << '\n'
      << "  p95: " << Ms(m.p95_ms) << '\n'
      << "  p99: " << Ms(m.p99_ms) << '\n';
  return out.str();
}

} // namespace probekit::artifacts
