#include "metrics/execution_metrics.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace probekit::metrics {

double PercentileFromSorted(const std::vector<double>& sorted_ms, const double percentile) {
  if (sorted_ms.empty()) {
    return 0.0;
  }

  const double raw_index =
      std::floor(static_cast<double>(sorted_ms.size()) * percentile / 100.0);
  std::size_t index = raw_index <= 0.0 ? 0U : static_cast<std::size_t>(raw_index);
  index = std::min(index, sorted_ms.size() - 1U);
  return sorted_ms[index];
}

ExecutionMetrics FinalizeMetrics(const std::vector<InvocationOutcome>& outcomes,
                                 const std::chrono::microseconds window) {
  ExecutionMetrics metrics;
  if (outcomes.empty()) {
    return metrics;
  }

  std::vector<double> latencies_ms;
  latencies_ms.reserve(outcomes.size());
  for (const auto& outcome : outcomes) {
    latencies_ms.push_back(core::ToMillis(outcome.latency));
    if (outcome.success) {
      ++metrics.success;
    }
  }
  std::sort(latencies_ms.begin(), latencies_ms.end());

  const auto count = static_cast<double>(latencies_ms.size());
  metrics.total = static_cast<std::uint64_t>(latencies_ms.size());
  metrics.fail = metrics.total - metrics.success;
  metrics.success_rate = static_cast<double>(metrics.success) / count * 100.0;
  metrics.avg_latency_ms = std::accumulate(latencies_ms.begin(), latencies_ms.end(), 0.0) / count;
  metrics.min_latency_ms = latencies_ms.front();
  metrics.max_latency_ms = latencies_ms.back();
  metrics.p50_ms = PercentileFromSorted(latencies_ms, 50.0);
  metrics.p95_ms = PercentileFromSorted(latencies_ms, 95.0);
  metrics.p99_ms = PercentileFromSorted(latencies_ms, 99.0);

  if (window > std::chrono::microseconds::zero()) {
    const double window_seconds = static_cast<double>(window.count()) / 1'000'000.0;
    metrics.rps = count / window_seconds;
  }
  return metrics;
}

} // namespace probekit::metrics
