#include "metrics/result_collector.hpp"

#include <utility>

namespace probekit::metrics {

bool ResultCollector::Record(InvocationOutcome outcome, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (finalized_) {
    error = "result collector is finalized; outcome for '" + outcome.scenario_id +
            "' was not recorded";
    return false;
  }
  outcomes_.push_back(std::move(outcome));
  return true;
}

std::size_t ResultCollector::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return outcomes_.size();
}

bool ResultCollector::Finalize(const std::chrono::microseconds window, ExecutionMetrics& metrics,
                               std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (finalized_) {
    error = "result collector was already finalized";
    return false;
  }
  finalized_ = true;
  metrics = FinalizeMetrics(outcomes_, window);
  return true;
}

std::vector<InvocationOutcome> ResultCollector::TakeOutcomes() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!finalized_) {
    return {};
  }
  return std::exchange(outcomes_, {});
}

} // namespace probekit::metrics
