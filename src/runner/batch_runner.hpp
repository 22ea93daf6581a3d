#pragma once

#include "core/logging/logger.hpp"
#include "metrics/execution_metrics.hpp"
#include "metrics/outcome.hpp"
#include "probe/probe.hpp"
#include "runner/admission_gate.hpp"
#include "scenarios/scenario.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace probekit::runner {

constexpr int kDefaultBatchConcurrency = 5;

// Called once per finished scenario from the worker thread that ran it.
// `index` is the position in the executed (post-filter) scenario list.
// An exception thrown by the observer is logged as a warning and dropped; the
// outcome is already stored and the worker moves on to the next slot.
using OutcomeObserver =
    std::function<void(std::size_t index, const metrics::InvocationOutcome& outcome)>;

struct BatchOptions {
  // Ceiling on simultaneous in-flight invocations. Values <= 0 fall back to
  // kDefaultBatchConcurrency.
  int concurrency = kDefaultBatchConcurrency;

  // Optional category filters. `category` keeps only that category;
  // `categories` keeps any listed category. Both may be set.
  std::string category;
  std::vector<std::string> categories;

  // Optional externally owned gate, e.g. to inspect the in-flight peak after
  // the run. When null the runner owns a gate sized to `concurrency`.
  AdmissionGate* gate = nullptr;

  OutcomeObserver on_outcome;
};

struct BatchRunResult {
  // outcomes[i] belongs to the scenario at source_index[i] in the input list.
  std::vector<metrics::InvocationOutcome> outcomes;
  std::vector<std::size_t> source_index;
  std::size_t skipped = 0;
  int concurrency = 0;
  std::size_t workers = 0;
  std::size_t peak_in_flight = 0;
  std::chrono::microseconds elapsed{0};
  metrics::ExecutionMetrics metrics;
};

// Returns the positions of `scenarios` that pass the category filters.
std::vector<std::size_t> SelectScenarios(const std::vector<scenarios::ScenarioDescriptor>& scenarios,
                                         const BatchOptions& options);

// Runs a fixed, known-size set of scenarios under a concurrency ceiling.
//
// Contract:
// - blocks until every selected scenario has produced exactly one outcome
// - outcome order matches input order regardless of completion order
// - at most `concurrency` probe calls are in flight at any instant
// - one failing call is recorded and never affects its siblings
// - an empty input (or a filter that leaves nothing) is rejected with an error
class BoundedBatchRunner {
public:
  explicit BoundedBatchRunner(probe::IProbe& probe, core::logging::Logger* logger = nullptr)
      : probe_(probe), logger_(logger) {}

  bool Run(const std::vector<scenarios::ScenarioDescriptor>& scenarios, int concurrency,
           std::vector<metrics::InvocationOutcome>& outcomes, std::string& error) const;

  bool Run(const std::vector<scenarios::ScenarioDescriptor>& scenarios,
           const BatchOptions& options, BatchRunResult& result, std::string& error) const;

private:
  probe::IProbe& probe_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace probekit::runner
