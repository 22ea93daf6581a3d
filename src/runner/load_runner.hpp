#pragma once

#include "core/logging/logger.hpp"
#include "metrics/execution_metrics.hpp"
#include "metrics/result_collector.hpp"
#include "probe/probe.hpp"
#include "runner/load_profile.hpp"
#include "scenarios/scenario.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace probekit::runner {

constexpr int kDefaultLoadConcurrency = 10;
constexpr std::chrono::milliseconds kDefaultLoadDuration{30'000};

// Upper bound on a run's length. Longer deadlines no longer fit the steady
// clock once added to now().
constexpr std::chrono::milliseconds kMaxLoadDuration{24 * 60 * 60 * 1'000};

// Slowest accepted per-user rate (req/s). Slower rates give a throttle
// interval that cannot be represented in microseconds.
constexpr double kMinRatePerUser = 1e-6;

struct LoadRunConfig {
  // Number of virtual users. Values <= 0 fall back to kDefaultLoadConcurrency.
  int concurrency = 0;

  // Run length. Values <= 0 fall back to kDefaultLoadDuration; values above
  // kMaxLoadDuration are rejected.
  std::chrono::milliseconds duration{0};

  // Requests per second for EACH virtual user. Every worker sleeps 1s/rate
  // between its own calls, so the attempted aggregate rate is
  // rate * concurrency. Unset or 0 means unthrottled; negative values and
  // positive values below kMinRatePerUser are rejected.
  std::optional<double> rate_per_user;

  // Label only; carried into the result for reporting.
  LoadMode mode = LoadMode::kLoad;
};

// Fills unset concurrency/duration from the mode's preset. Explicit values
// always win.
LoadRunConfig ApplyProfile(LoadMode mode, LoadRunConfig config);

// One-way lifecycle of a DurationLoadRunner.
enum class RunState {
  kIdle,
  kRunning,
  kStopping,
  kDone,
};

enum class StopCause {
  kNone,
  kDeadline,
  kCancelled,
};

const char* ToString(RunState state);
const char* ToString(StopCause cause);

struct LoadRunResult {
  metrics::ExecutionMetrics metrics;
  LoadMode mode = LoadMode::kLoad;
  int concurrency = 0;
  std::chrono::milliseconds duration{0};
  std::optional<double> rate_per_user;
  std::chrono::microseconds elapsed{0};
  std::size_t workers_joined = 0;
  StopCause stop_cause = StopCause::kNone;
};

// Continuous virtual-user traffic until a deadline or an external cancel.
//
// Each worker loops: pick the next target (worker-local round robin, worker i
// starting at offset i), invoke the probe, record the outcome, optionally
// throttle. The stop signal is only observed between iterations; an in-flight
// call always finishes and is recorded. Run joins every worker before it
// finalizes metrics.
//
// Idle -> Running -> Stopping -> Done. A runner instance is single-use.
// Cancel may be called from any thread at any time; a cancel that arrives
// before Run makes the run stop right after it starts.
class DurationLoadRunner {
public:
  explicit DurationLoadRunner(probe::IProbe& probe, core::logging::Logger* logger = nullptr)
      : probe_(probe), logger_(logger) {}

  DurationLoadRunner(const DurationLoadRunner&) = delete;
  DurationLoadRunner& operator=(const DurationLoadRunner&) = delete;

  bool Run(const std::vector<scenarios::TargetDescriptor>& targets, const LoadRunConfig& config,
           LoadRunResult& result, std::string& error);

  void Cancel();

  RunState state() const;

private:
  void WorkerLoop(std::size_t worker_index, const std::vector<scenarios::TargetDescriptor>& targets,
                  std::optional<std::chrono::microseconds> throttle,
                  metrics::ResultCollector& collector);
  // Blocks until `until` or until stop is raised. Returns true when stopped.
  bool WaitForStop(std::chrono::steady_clock::time_point until);
  void RaiseStop(StopCause cause);

  probe::IProbe& probe_;
  core::logging::Logger* logger_ = nullptr;

  mutable std::mutex mu_;
  std::condition_variable stop_cv_;
  RunState state_ = RunState::kIdle;
  StopCause stop_cause_ = StopCause::kNone;
  bool cancel_requested_ = false;
  bool stop_requested_ = false;
  // Mirrors stop_requested_ so workers can poll without taking mu_.
  std::atomic<bool> stop_{false};
};

} // namespace probekit::runner
