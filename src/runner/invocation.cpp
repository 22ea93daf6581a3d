#include "runner/invocation.hpp"

#include "core/time_utils.hpp"
#include "scenarios/expectation_check.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace probekit::runner {

namespace {

struct TimedCall {
  bool completed = false;
  probe::ProbeResponse response;
  std::string error;
  std::chrono::microseconds latency{0};
};

TimedCall CallProbe(probe::IProbe& probe, const probe::ProbeRequest& request) {
  TimedCall call;
  const auto started = std::chrono::steady_clock::now();
  try {
    call.completed = probe.Invoke(request, call.response, call.error);
  } catch (const std::exception& ex) {
    call.completed = false;
    call.error = std::string("probe threw: ") + ex.what();
  } catch (...) {
    call.completed = false;
    call.error = "probe threw a non-standard exception";
  }
  const auto measured = core::MicrosSince(started);

  call.latency = (call.completed && call.response.latency > std::chrono::microseconds::zero())
                     ? call.response.latency
                     : measured;
  if (!call.completed && call.error.empty()) {
    call.error = "probe reported failure without a message";
  }
  return call;
}

} // namespace

metrics::InvocationOutcome InvokeScenario(probe::IProbe& probe,
                                          const scenarios::ScenarioDescriptor& scenario) {
  metrics::InvocationOutcome outcome;
  outcome.scenario_id = scenario.id;
  outcome.scenario_name = scenario.name;
  outcome.category = scenario.category;
  outcome.severity = scenario.severity;
  outcome.expected_status = scenario.expectation.status_code;

  TimedCall call = CallProbe(probe, scenario.request);
  outcome.latency = call.latency;
  outcome.finished_at = std::chrono::system_clock::now();

  if (!call.completed) {
    outcome.success = false;
    outcome.error = "request failed: " + call.error;
    return outcome;
  }

  outcome.actual_status = call.response.status_code;
  const scenarios::ExpectationVerdict verdict =
      scenarios::CheckExpectation(scenario.expectation, call.response, call.latency);
  outcome.success = verdict.passed;
  if (!verdict.passed) {
    outcome.error = verdict.Message();
  }
  outcome.response_body = std::move(call.response.body);
  return outcome;
}

metrics::InvocationOutcome InvokeTarget(probe::IProbe& probe,
                                        const scenarios::TargetDescriptor& target) {
  metrics::InvocationOutcome outcome;
  outcome.scenario_id = scenarios::TargetLabel(target);
  if (target.expectation.has_value()) {
    outcome.expected_status = target.expectation->status_code;
  }

  const TimedCall call = CallProbe(probe, target.request);
  outcome.latency = call.latency;
  outcome.finished_at = std::chrono::system_clock::now();

  if (!call.completed) {
    outcome.success = false;
    outcome.error = "request failed: " + call.error;
    return outcome;
  }

  outcome.actual_status = call.response.status_code;
  const scenarios::ExpectationVerdict verdict =
      target.expectation.has_value()
          ? scenarios::CheckExpectation(target.expectation.value(), call.response, call.latency)
          : scenarios::CheckDefaultSuccess(call.response);
  outcome.success = verdict.passed;
  if (!verdict.passed) {
    outcome.error = verdict.Message();
  }
  return outcome;
}

} // namespace probekit::runner
