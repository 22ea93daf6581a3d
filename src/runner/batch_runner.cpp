#include "runner/batch_runner.hpp"

#include "core/time_utils.hpp"
#include "runner/invocation.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace probekit::runner {

namespace {

using core::logging::LogIf;
using core::logging::LogLevel;

bool MatchesCategory(const scenarios::ScenarioDescriptor& scenario, const BatchOptions& options) {
  if (!options.category.empty() && scenario.category != options.category) {
    return false;
  }
  if (!options.categories.empty() &&
      std::find(options.categories.begin(), options.categories.end(), scenario.category) ==
          options.categories.end()) {
    return false;
  }
  return true;
}

void NotifyObserver(const OutcomeObserver& observer, std::size_t slot,
                    const metrics::InvocationOutcome& outcome, core::logging::Logger* logger) {
  try {
    observer(slot, outcome);
  } catch (const std::exception& ex) {
    LogIf(logger, LogLevel::kWarn, "batch observer threw",
          {{"scenario_id", outcome.scenario_id}, {"error", ex.what()}});
  } catch (...) {
    LogIf(logger, LogLevel::kWarn, "batch observer threw",
          {{"scenario_id", outcome.scenario_id}, {"error", "non-standard exception"}});
  }
}

} // namespace

std::vector<std::size_t> SelectScenarios(const std::vector<scenarios::ScenarioDescriptor>& scenarios,
                                         const BatchOptions& options) {
  std::vector<std::size_t> selected;
  selected.reserve(scenarios.size());
  for (std::size_t i = 0; i < scenarios.size(); ++i) {
    if (MatchesCategory(scenarios[i], options)) {
      selected.push_back(i);
    }
  }
  return selected;
}

bool BoundedBatchRunner::Run(const std::vector<scenarios::ScenarioDescriptor>& scenarios,
                             const int concurrency,
                             std::vector<metrics::InvocationOutcome>& outcomes,
                             std::string& error) const {
  BatchOptions options;
  options.concurrency = concurrency;
  BatchRunResult result;
  if (!Run(scenarios, options, result, error)) {
    outcomes.clear();
    return false;
  }
  outcomes = std::move(result.outcomes);
  return true;
}

bool BoundedBatchRunner::Run(const std::vector<scenarios::ScenarioDescriptor>& scenarios,
                             const BatchOptions& options, BatchRunResult& result,
                             std::string& error) const {
  result = BatchRunResult{};
  error.clear();

  if (scenarios.empty()) {
    error = "batch requires at least one scenario";
    return false;
  }

  result.source_index = SelectScenarios(scenarios, options);
  result.skipped = scenarios.size() - result.source_index.size();
  if (result.source_index.empty()) {
    error = "no scenarios matched the category filter";
    return false;
  }

  int concurrency = options.concurrency;
  if (concurrency <= 0) {
    LogIf(logger_, LogLevel::kWarn, "batch concurrency corrected to default",
          {{"requested", std::to_string(concurrency)},
           {"applied", std::to_string(kDefaultBatchConcurrency)}});
    concurrency = kDefaultBatchConcurrency;
  }
  result.concurrency = concurrency;

  std::unique_ptr<AdmissionGate> owned_gate;
  AdmissionGate* gate = options.gate;
  if (gate == nullptr) {
    owned_gate = std::make_unique<AdmissionGate>(static_cast<std::size_t>(concurrency));
    gate = owned_gate.get();
  }

  const std::size_t count = result.source_index.size();
  result.outcomes.resize(count);

  LogIf(logger_, LogLevel::kInfo, "batch started",
        {{"scenarios", std::to_string(count)},
         {"skipped", std::to_string(result.skipped)},
         {"concurrency", std::to_string(concurrency)}});

  // Workers claim slots from a shared cursor and write only their own slot,
  // so positional alignment needs no extra locking. join() publishes every
  // slot back to this thread.
  std::atomic<std::size_t> cursor{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t slot = cursor.fetch_add(1U, std::memory_order_relaxed);
      if (slot >= count) {
        return;
      }
      const scenarios::ScenarioDescriptor& scenario = scenarios[result.source_index[slot]];
      {
        AdmissionTicket ticket(*gate);
        result.outcomes[slot] = InvokeScenario(probe_, scenario);
      }

      const metrics::InvocationOutcome& outcome = result.outcomes[slot];
      if (!outcome.success) {
        LogIf(logger_, LogLevel::kDebug, "scenario failed",
              {{"scenario_id", outcome.scenario_id},
               {"reason", outcome.error.value_or("")}});
      }
      if (options.on_outcome) {
        NotifyObserver(options.on_outcome, slot, outcome, logger_);
      }
    }
  };

  const std::size_t wanted_workers = std::min(count, static_cast<std::size_t>(concurrency));
  const auto started = std::chrono::steady_clock::now();

  std::vector<std::thread> workers;
  workers.reserve(wanted_workers);
  for (std::size_t i = 0; i < wanted_workers; ++i) {
    try {
      workers.emplace_back(worker);
    } catch (const std::system_error& ex) {
      // Fewer workers only lowers parallelism; the shared cursor still hands
      // every slot to someone.
      LogIf(logger_, LogLevel::kWarn, "batch worker spawn failed",
            {{"spawned", std::to_string(workers.size())}, {"error", ex.what()}});
      break;
    }
  }

  if (workers.empty()) {
    worker();
  }
  for (auto& thread : workers) {
    thread.join();
  }

  result.elapsed = core::MicrosSince(started);
  result.workers = std::max<std::size_t>(workers.size(), 1U);
  result.peak_in_flight = gate->peak_in_flight();
  result.metrics = metrics::FinalizeMetrics(result.outcomes);

  LogIf(logger_, LogLevel::kInfo, "batch finished",
        {{"passed", std::to_string(result.metrics.success)},
         {"failed", std::to_string(result.metrics.fail)},
         {"elapsed_ms", std::to_string(result.elapsed.count() / 1000)}});
  return true;
}

} // namespace probekit::runner
