#pragma once

#include "probe/sim_probe.hpp"
#include "runner/load_profile.hpp"
#include "scenarios/scenario.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace probekit::plan {

// Fixed-batch plan: a list of scenarios plus batch options.
struct BatchPlan {
  std::string base_url;
  int concurrency = 0;
  std::string category;
  std::vector<std::string> categories;
  probe::sim::SimProbeConfig probe;
  std::vector<scenarios::ScenarioDescriptor> scenarios;
};

// Duration-bound plan. Zero concurrency/duration mean "use the mode preset".
struct LoadPlan {
  std::string base_url;
  runner::LoadMode mode = runner::LoadMode::kLoad;
  int concurrency = 0;
  std::chrono::milliseconds duration{0};
  std::optional<double> rate_per_user;
  // Pass criterion for the CLI exit code, in percent.
  std::optional<double> min_success_rate;
  probe::sim::SimProbeConfig probe;
  std::vector<scenarios::TargetDescriptor> targets;
};

// Joins a base URL and a scenario path with exactly one '/' between them.
// An empty base returns `path` unchanged.
std::string JoinTarget(std::string_view base_url, std::string_view path);

// Parsers are strict about types: a present field with the wrong JSON type is
// a hard error naming the field path (e.g. `scenarios[2].expected.status_code`).
// Unknown keys are ignored.
bool ParseBatchPlanText(std::string_view json_text, BatchPlan& plan, std::string& error);
bool ParseLoadPlanText(std::string_view json_text, LoadPlan& plan, std::string& error);

bool ReadBatchPlanFile(const std::string& path, BatchPlan& plan, std::string& error);
bool ReadLoadPlanFile(const std::string& path, LoadPlan& plan, std::string& error);

} // namespace probekit::plan
