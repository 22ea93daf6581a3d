#include "runner/load_runner.hpp"

#include "../common/assertions.hpp"
#include "../common/probe_fixtures.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using probekit::tests::common::AssertContains;
using probekit::tests::common::Fail;
using probekit::tests::common::MakeTarget;
using probekit::tests::common::ScriptedProbe;

} // namespace

int main() {
  using probekit::runner::DurationLoadRunner;
  using probekit::runner::LoadRunConfig;
  using probekit::runner::LoadRunResult;
  using probekit::runner::RunState;
  using probekit::runner::StopCause;
  using probekit::scenarios::TargetDescriptor;

  const std::vector<TargetDescriptor> targets = {MakeTarget("/health"), MakeTarget("/users")};

  {
    // Deadline bound: 2s with 3 users and an instant probe finishes promptly
    // and joins every worker.
    ScriptedProbe probe;
    DurationLoadRunner runner(probe);
    LoadRunConfig config;
    config.concurrency = 3;
    config.duration = std::chrono::milliseconds(2'000);

    LoadRunResult result;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    if (!runner.Run(targets, config, result, error)) {
      Fail("load run failed unexpectedly: " + error);
    }
    const auto wall = std::chrono::steady_clock::now() - started;

    if (wall > std::chrono::milliseconds(2'500)) {
      Fail("load run overran its 2s deadline by more than 500ms");
    }
    if (wall < std::chrono::milliseconds(2'000)) {
      Fail("load run returned before its deadline");
    }
    if (result.workers_joined != 3U || result.concurrency != 3) {
      Fail("expected all 3 virtual users to be joined");
    }
    if (result.stop_cause != StopCause::kDeadline) {
      Fail("expected deadline stop cause");
    }
    if (runner.state() != RunState::kDone) {
      Fail("expected runner to be done after Run returns");
    }
    if (result.metrics.total == 0U || result.metrics.total != result.metrics.success) {
      Fail("expected a non-empty all-success sample");
    }
    if (result.metrics.total != static_cast<std::uint64_t>(probe.calls())) {
      Fail("every probe call must be recorded exactly once");
    }
    if (result.metrics.rps <= 0.0) {
      Fail("expected positive throughput");
    }

    // Single-use: a second Run is rejected.
    if (runner.Run(targets, config, result, error)) {
      Fail("expected a finished runner to reject Run");
    }
    AssertContains(error, "single-use");
  }

  {
    // External cancel stops a long run early; in-flight calls still land.
    ScriptedProbe probe;
    probe.service_time = std::chrono::milliseconds(5);
    DurationLoadRunner runner(probe);
    LoadRunConfig config;
    config.concurrency = 4;
    config.duration = std::chrono::milliseconds(30'000);

    std::thread canceller([&runner] {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      runner.Cancel();
    });

    LoadRunResult result;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    const bool ok = runner.Run(targets, config, result, error);
    const auto wall = std::chrono::steady_clock::now() - started;
    canceller.join();

    if (!ok) {
      Fail("cancelled run should still report metrics: " + error);
    }
    if (wall > std::chrono::seconds(5)) {
      Fail("cancel did not stop the run early");
    }
    if (result.stop_cause != StopCause::kCancelled) {
      Fail("expected cancelled stop cause");
    }
    if (result.workers_joined != 4U) {
      Fail("expected all workers joined after cancel");
    }
    if (result.metrics.total != static_cast<std::uint64_t>(probe.calls())) {
      Fail("in-flight calls at cancel time must still be recorded");
    }
  }

  {
    // A cancel issued before Run makes the run stop right after it starts.
    ScriptedProbe probe;
    DurationLoadRunner runner(probe);
    runner.Cancel();

    LoadRunConfig config;
    config.concurrency = 2;
    config.duration = std::chrono::milliseconds(10'000);
    LoadRunResult result;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    if (!runner.Run(targets, config, result, error)) {
      Fail("pre-cancelled run failed unexpectedly: " + error);
    }
    if (std::chrono::steady_clock::now() - started > std::chrono::seconds(2)) {
      Fail("pre-cancelled run did not stop promptly");
    }
    if (result.stop_cause != StopCause::kCancelled) {
      Fail("expected cancelled stop cause for pre-cancelled run");
    }
  }

  {
    // Rate is per virtual user: 2 users at 10 req/s for 1s attempt about 20
    // calls in total, never an unthrottled flood.
    ScriptedProbe probe;
    DurationLoadRunner runner(probe);
    LoadRunConfig config;
    config.concurrency = 2;
    config.duration = std::chrono::milliseconds(1'000);
    config.rate_per_user = 10.0;

    LoadRunResult result;
    std::string error;
    if (!runner.Run(targets, config, result, error)) {
      Fail("throttled run failed unexpectedly: " + error);
    }
    if (result.metrics.total < 4U || result.metrics.total > 24U) {
      Fail("throttled total out of expected band: " + std::to_string(result.metrics.total));
    }
    if (!result.rate_per_user.has_value() || result.rate_per_user.value() != 10.0) {
      Fail("expected rate to be carried into the result");
    }
  }

  {
    // Worker-local round robin: a single user alternates between targets.
    ScriptedProbe probe;
    probe.status_by_target = {{"/users", 500}};
    probe.service_time = std::chrono::milliseconds(1);
    DurationLoadRunner runner(probe);
    LoadRunConfig config;
    config.concurrency = 1;
    config.duration = std::chrono::milliseconds(300);

    LoadRunResult result;
    std::string error;
    if (!runner.Run(targets, config, result, error)) {
      Fail("round-robin run failed unexpectedly: " + error);
    }
    const auto success = static_cast<std::int64_t>(result.metrics.success);
    const auto fail = static_cast<std::int64_t>(result.metrics.fail);
    if (success - fail != 0 && success - fail != 1) {
      Fail("expected strict alternation starting at the first target");
    }
  }

  {
    // Boundary validation happens before the runner leaves Idle.
    ScriptedProbe probe;
    std::ostringstream log_sink;
    probekit::core::logging::Logger logger(probekit::core::logging::LogLevel::kDebug, log_sink);
    DurationLoadRunner runner(probe, &logger);

    LoadRunConfig config;
    config.concurrency = 1;
    config.duration = std::chrono::milliseconds(50);
    LoadRunResult result;
    std::string error;
    if (runner.Run({}, config, result, error)) {
      Fail("expected empty target set to be rejected");
    }
    AssertContains(error, "at least one target");

    config.rate_per_user = -1.0;
    if (runner.Run(targets, config, result, error)) {
      Fail("expected negative rate to be rejected");
    }
    AssertContains(error, "rate per user");

    // Tiny positive rates would round to an out-of-range throttle interval.
    config.rate_per_user = 1e-13;
    if (runner.Run(targets, config, result, error)) {
      Fail("expected a rate below the minimum to be rejected");
    }
    AssertContains(error, "at least");

    // Durations whose deadline overflows the steady clock are rejected.
    config.rate_per_user.reset();
    config.duration = std::chrono::milliseconds(9'000'000'000'000'000);
    if (runner.Run(targets, config, result, error)) {
      Fail("expected an oversized duration to be rejected");
    }
    AssertContains(error, "exceeds max");
    config.duration = probekit::runner::kMaxLoadDuration + std::chrono::milliseconds(1);
    if (runner.Run(targets, config, result, error)) {
      Fail("expected a duration just above the cap to be rejected");
    }
    config.duration = std::chrono::milliseconds(50);
    if (runner.state() != RunState::kIdle) {
      Fail("rejected configuration must leave the runner idle");
    }

    config.rate_per_user.reset();
    config.concurrency = 0;
    if (!runner.Run(targets, config, result, error)) {
      Fail("zero concurrency should be corrected, not rejected: " + error);
    }
    if (result.concurrency != probekit::runner::kDefaultLoadConcurrency) {
      Fail("expected concurrency to fall back to the default");
    }
    AssertContains(log_sink.str(), "load concurrency corrected to default");
    AssertContains(log_sink.str(), "stop_cause=\"deadline\"");
  }

  {
    // The slowest accepted rate throttles each user to a single call.
    ScriptedProbe backend;
    DurationLoadRunner runner(backend);
    LoadRunConfig config;
    config.concurrency = 1;
    config.duration = std::chrono::milliseconds(300);
    config.rate_per_user = probekit::runner::kMinRatePerUser;

    LoadRunResult result;
    std::string error;
    if (!runner.Run(targets, config, result, error)) {
      Fail("minimum rate run failed unexpectedly: " + error);
    }
    if (backend.calls() != 1 || result.metrics.total != 1U) {
      Fail("expected exactly one call at the minimum rate, got " +
           std::to_string(backend.calls()));
    }
    if (result.stop_cause != StopCause::kDeadline) {
      Fail("minimum rate run should end at the deadline");
    }
  }

  return 0;
}
