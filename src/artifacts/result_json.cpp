#include "artifacts/result_json.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace probekit::artifacts {

namespace {

using core::FormatFixedDouble;
using core::Quoted;

void WriteHeader(std::ostringstream& out, const RunHeader& header) {
  out << "\"run_id\":" << Quoted(header.run_id) << ","
      << "\"kind\":" << Quoted(header.kind) << ","
      << "\"started_at_utc\":" << Quoted(core::FormatUtcTimestamp(header.started_at)) << ","
      << "\"finished_at_utc\":" << Quoted(core::FormatUtcTimestamp(header.finished_at)) << ",";
}

} // namespace

std::string ToJson(const metrics::ExecutionMetrics& metrics) {
  std::ostringstream out;
  out << "{"
      << "\"total\":" << metrics.total << ","
      << "\"success\":" << metrics.success << ","
      << "\"fail\":" << metrics.fail << ","
      << "\"success_rate\":" << FormatFixedDouble(metrics.success_rate, 2) << ","
      << "\"avg_latency_ms\":" << FormatFixedDouble(metrics.avg_latency_ms, 3) << ","
      << "\"min_latency_ms\":" << FormatFixedDouble(metrics.min_latency_ms, 3) << ","
      << "\"max_latency_ms\":" << FormatFixedDouble(metrics.max_latency_ms, 3) << ","
      << "\"p50_ms\":" << FormatFixedDouble(metrics.p50_ms, 3) << ","
      << "\"p95_ms\":" << FormatFixedDouble(metrics.p95_ms, 3) << ","
      << "\"p99_ms\":" << FormatFixedDouble(metrics.p99_ms, 3) << ","
      << "\"rps\":" << FormatFixedDouble(metrics.rps, 2) << "}";
  return out.str();
}

std::string ToJson(const metrics::InvocationOutcome& outcome) {
  std::ostringstream out;
  out << "{"
      << "\"scenario_id\":" << Quoted(outcome.scenario_id) << ","
      << "\"scenario_name\":" << Quoted(outcome.scenario_name) << ","
      << "\"category\":" << Quoted(outcome.category) << ","
      << "\"severity\":" << Quoted(outcome.severity) << ","
      << "\"passed\":" << (outcome.success ? "true" : "false") << ","
      << "\"actual_status\":" << outcome.actual_status;
  if (outcome.expected_status.has_value()) {
    out << ",\"expected_status\":" << outcome.expected_status.value();
  }
  out << ",\"duration_ms\":" << FormatFixedDouble(core::ToMillis(outcome.latency), 3);
  if (outcome.error.has_value()) {
    out << ",\"error\":" << Quoted(outcome.error.value());
  }
  if (outcome.response_body.has_value()) {
    out << ",\"response_body\":" << Quoted(outcome.response_body.value());
  }
  out << ",\"finished_at_utc\":" << Quoted(core::FormatUtcTimestamp(outcome.finished_at)) << "}";
  return out.str();
}

std::string BatchReportJson(const RunHeader& header, const runner::BatchRunResult& result) {
  std::ostringstream out;
  out << "{";
  WriteHeader(out, header);
  out << "\"concurrency\":" << result.concurrency << ","
      << "\"workers\":" << result.workers << ","
      << "\"peak_in_flight\":" << result.peak_in_flight << ","
      << "\"skipped\":" << result.skipped << ","
      << "\"elapsed_ms\":" << FormatFixedDouble(core::ToMillis(result.elapsed), 3) << ","
      << "\"metrics\":" << ToJson(result.metrics) << ","
      << "\"results\":[";
  for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << ToJson(result.outcomes[i]);
  }
  out << "]}";
  return out.str();
}

std::string LoadReportJson(const RunHeader& header, const runner::LoadRunResult& result) {
  std::ostringstream out;
  out << "{";
  WriteHeader(out, header);
  out << "\"mode\":" << Quoted(runner::ToString(result.mode)) << ","
      << "\"concurrency\":" << result.concurrency << ","
      << "\"duration_ms\":" << result.duration.count() << ",";
  if (result.rate_per_user.has_value()) {
    out << "\"rate_per_user\":" << FormatFixedDouble(result.rate_per_user.value(), 2) << ",";
  }
  out << "\"elapsed_ms\":" << FormatFixedDouble(core::ToMillis(result.elapsed), 3) << ","
      << "\"workers_joined\":" << result.workers_joined << ","
      << "\"stop_cause\":" << Quoted(runner::ToString(result.stop_cause)) << ","
      << "\"metrics\":" << ToJson(result.metrics) << "}";
  return out.str();
}

} // namespace probekit::artifacts
