#ifndef PROBEKIT_TESTS_COMMON_PROBE_FIXTURES_HPP_
#define PROBEKIT_TESTS_COMMON_PROBE_FIXTURES_HPP_

#include "probe/probe.hpp"
#include "scenarios/scenario.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace probekit::tests::common {

// Probe whose answer depends only on the request target, so tests can script
// per-scenario results while the runner calls it from many threads. It also
// measures how many calls overlap.
class ScriptedProbe final : public probe::IProbe {
public:
  // target -> status code. Unlisted targets answer `default_status`.
  std::map<std::string, int> status_by_target;
  int default_status = 200;
  // Targets that fail at transport level / throw from Invoke.
  std::vector<std::string> failing_targets;
  std::vector<std::string> throwing_targets;
  std::chrono::microseconds service_time{0};
  // target -> service time override, to make completion order differ from
  // submission order.
  std::map<std::string, std::chrono::microseconds> service_time_by_target;

  bool Invoke(const probe::ProbeRequest& request, probe::ProbeResponse& response,
              std::string& error) override {
    const int now_in_flight = in_flight_.fetch_add(1) + 1;
    int seen = peak_in_flight_.load();
    while (now_in_flight > seen && !peak_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
    }
    calls_.fetch_add(1);

    std::chrono::microseconds wait = service_time;
    if (const auto it = service_time_by_target.find(request.target);
        it != service_time_by_target.end()) {
      wait = it->second;
    }
    if (wait > std::chrono::microseconds::zero()) {
      std::this_thread::sleep_for(wait);
    }
    in_flight_.fetch_sub(1);

    if (Contains(throwing_targets, request.target)) {
      throw std::runtime_error("scripted explosion for " + request.target);
    }
    if (Contains(failing_targets, request.target)) {
      error = "scripted transport failure for " + request.target;
      return false;
    }

    response = probe::ProbeResponse{};
    const auto it = status_by_target.find(request.target);
    response.status_code = it == status_by_target.end() ? default_status : it->second;
    response.body = "{\"target\":\"" + request.target + "\"}";
    response.headers = {{"Content-Type", "application/json"}};
    response.latency = wait;
    return true;
  }

  int peak_in_flight() const {
    return peak_in_flight_.load();
  }
  int calls() const {
    return calls_.load();
  }

private:
  static bool Contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
  }

  std::atomic<int> in_flight_{0};
  std::atomic<int> peak_in_flight_{0};
  std::atomic<int> calls_{0};
};

inline scenarios::ScenarioDescriptor MakeScenario(std::string id, std::string target,
                                                  std::optional<int> expected_status = 200,
                                                  std::string category = "functional") {
  scenarios::ScenarioDescriptor scenario;
  scenario.id = id;
  scenario.name = "scenario " + id;
  scenario.category = std::move(category);
  scenario.request.method = "GET";
  scenario.request.target = std::move(target);
  scenario.expectation.status_code = expected_status;
  return scenario;
}

inline scenarios::TargetDescriptor MakeTarget(std::string target, std::string method = "GET") {
  scenarios::TargetDescriptor descriptor;
  descriptor.request.method = std::move(method);
  descriptor.request.target = std::move(target);
  return descriptor;
}

} // namespace probekit::tests::common

#endif // PROBEKIT_TESTS_COMMON_PROBE_FIXTURES_HPP_
