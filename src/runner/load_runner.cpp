#include "runner/load_runner.hpp"

#include "core/time_utils.hpp"
#include "runner/invocation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>

namespace probekit::runner {

namespace {

using core::logging::LogIf;
using core::logging::LogLevel;

std::string FormatRate(const std::optional<double>& rate) {
  if (!rate.has_value() || rate.value() <= 0.0) {
    return "unthrottled";
  }
  return std::to_string(rate.value());
}

} // namespace

LoadRunConfig ApplyProfile(const LoadMode mode, LoadRunConfig config) {
  const LoadProfile profile = ProfileFor(mode);
  config.mode = mode;
  if (config.concurrency <= 0) {
    config.concurrency = profile.concurrency;
  }
  if (config.duration <= std::chrono::milliseconds::zero()) {
    config.duration = std::chrono::duration_cast<std::chrono::milliseconds>(profile.duration);
  }
  return config;
}

const char* ToString(RunState state) {
  switch (state) {
  case RunState::kIdle:
    return "idle";
  case RunState::kRunning:
    return "running";
  case RunState::kStopping:
    return "stopping";
  case RunState::kDone:
    return "done";
  }

  return "idle";
}

const char* ToString(StopCause cause) {
  switch (cause) {
  case StopCause::kNone:
    return "none";
  case StopCause::kDeadline:
    return "deadline";
  case StopCause::kCancelled:
    return "cancelled";
  }

  return "none";
}

RunState DurationLoadRunner::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void DurationLoadRunner::Cancel() {
  bool raise = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancel_requested_ = true;
    raise = state_ == RunState::kRunning;
  }
  if (raise) {
    RaiseStop(StopCause::kCancelled);
  }
}

void DurationLoadRunner::RaiseStop(const StopCause cause) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!stop_requested_) {
      stop_requested_ = true;
      stop_cause_ = cause;
      if (state_ == RunState::kRunning) {
        state_ = RunState::kStopping;
      }
    }
    stop_.store(true, std::memory_order_release);
  }
  stop_cv_.notify_all();
}

bool DurationLoadRunner::WaitForStop(const std::chrono::steady_clock::time_point until) {
  std::unique_lock<std::mutex> lock(mu_);
  return stop_cv_.wait_until(lock, until, [this] { return stop_requested_; });
}

void DurationLoadRunner::WorkerLoop(const std::size_t worker_index,
                                    const std::vector<scenarios::TargetDescriptor>& targets,
                                    const std::optional<std::chrono::microseconds> throttle,
                                    metrics::ResultCollector& collector) {
  std::size_t next = worker_index % targets.size();
  while (!stop_.load(std::memory_order_acquire)) {
    const scenarios::TargetDescriptor& target = targets[next];
    next = (next + 1U) % targets.size();

    metrics::InvocationOutcome outcome = InvokeTarget(probe_, target);
    if (!outcome.success) {
      LogIf(logger_, LogLevel::kDebug, "virtual user call failed",
            {{"worker", std::to_string(worker_index)},
             {"target", outcome.scenario_id},
             {"reason", outcome.error.value_or("")}});
    }

    std::string record_error;
    if (!collector.Record(std::move(outcome), record_error)) {
      LogIf(logger_, LogLevel::kError, "virtual user could not record outcome",
            {{"worker", std::to_string(worker_index)}, {"error", record_error}});
      return;
    }

    if (throttle.has_value() &&
        WaitForStop(std::chrono::steady_clock::now() + throttle.value())) {
      return;
    }
  }
}

bool DurationLoadRunner::Run(const std::vector<scenarios::TargetDescriptor>& targets,
                             const LoadRunConfig& requested, LoadRunResult& result,
                             std::string& error) {
  result = LoadRunResult{};
  error.clear();

  if (targets.empty()) {
    error = "load run requires at least one target";
    return false;
  }
  if (requested.rate_per_user.has_value() &&
      (!std::isfinite(requested.rate_per_user.value()) || requested.rate_per_user.value() < 0.0)) {
    error = "rate per user must be a finite value >= 0";
    return false;
  }
  if (requested.rate_per_user.has_value() && requested.rate_per_user.value() > 0.0 &&
      requested.rate_per_user.value() < kMinRatePerUser) {
    error = "rate per user must be 0 (unthrottled) or at least " +
            std::to_string(kMinRatePerUser);
    return false;
  }
  if (requested.duration > kMaxLoadDuration) {
    error = "load duration " + std::to_string(requested.duration.count()) + "ms exceeds max " +
            std::to_string(kMaxLoadDuration.count()) + "ms";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != RunState::kIdle) {
      error = std::string("load runner is single-use (state: ") + ToString(state_) + ")";
      return false;
    }
    state_ = RunState::kRunning;
  }

  LoadRunConfig config = requested;
  if (config.concurrency <= 0) {
    LogIf(logger_, LogLevel::kWarn, "load concurrency corrected to default",
          {{"requested", std::to_string(config.concurrency)},
           {"applied", std::to_string(kDefaultLoadConcurrency)}});
    config.concurrency = kDefaultLoadConcurrency;
  }
  if (config.duration <= std::chrono::milliseconds::zero()) {
    LogIf(logger_, LogLevel::kWarn, "load duration corrected to default",
          {{"requested_ms", std::to_string(config.duration.count())},
           {"applied_ms", std::to_string(kDefaultLoadDuration.count())}});
    config.duration = kDefaultLoadDuration;
  }

  std::optional<std::chrono::microseconds> throttle;
  if (config.rate_per_user.has_value() && config.rate_per_user.value() > 0.0) {
    const auto interval_us =
        static_cast<std::int64_t>(std::llround(1'000'000.0 / config.rate_per_user.value()));
    throttle = std::chrono::microseconds(std::max<std::int64_t>(interval_us, 1));
  }

  LogIf(logger_, LogLevel::kInfo, "load run started",
        {{"mode", ToString(config.mode)},
         {"virtual_users", std::to_string(config.concurrency)},
         {"duration_ms", std::to_string(config.duration.count())},
         {"rate_per_user", FormatRate(config.rate_per_user)},
         {"targets", std::to_string(targets.size())}});

  bool cancelled_before_start = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_before_start = cancel_requested_;
  }
  if (cancelled_before_start) {
    RaiseStop(StopCause::kCancelled);
  }

  metrics::ResultCollector collector;
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + config.duration;

  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(config.concurrency));
  for (int i = 0; i < config.concurrency; ++i) {
    try {
      workers.emplace_back(&DurationLoadRunner::WorkerLoop, this, static_cast<std::size_t>(i),
                           std::cref(targets), throttle, std::ref(collector));
    } catch (const std::system_error& ex) {
      LogIf(logger_, LogLevel::kWarn, "virtual user spawn failed",
            {{"spawned", std::to_string(workers.size())}, {"error", ex.what()}});
      break;
    }
  }

  if (workers.empty()) {
    RaiseStop(StopCause::kNone);
    std::lock_guard<std::mutex> lock(mu_);
    state_ = RunState::kDone;
    error = "failed to start any virtual user";
    return false;
  }

  if (!WaitForStop(deadline)) {
    RaiseStop(StopCause::kDeadline);
  }

  for (auto& worker : workers) {
    worker.join();
  }

  const auto elapsed = core::MicrosSince(started);

  metrics::ExecutionMetrics metrics;
  if (!collector.Finalize(elapsed, metrics, error)) {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = RunState::kDone;
    return false;
  }

  StopCause cause = StopCause::kNone;
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = RunState::kDone;
    cause = stop_cause_;
  }

  result.metrics = metrics;
  result.mode = config.mode;
  result.concurrency = config.concurrency;
  result.duration = config.duration;
  result.rate_per_user = config.rate_per_user;
  result.elapsed = elapsed;
  result.workers_joined = workers.size();
  result.stop_cause = cause;

  LogIf(logger_, LogLevel::kInfo, "load run finished",
        {{"stop_cause", ToString(cause)},
         {"total", std::to_string(metrics.total)},
         {"success_rate", std::to_string(metrics.success_rate)},
         {"elapsed_ms", std::to_string(elapsed.count() / 1000)}});
  return true;
}

} // namespace probekit::runner
