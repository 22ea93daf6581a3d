#include "probekit/plan/plan_loader.hpp"

#include "core/json_dom.hpp"
#include "runner/load_runner.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>

namespace fs = std::filesystem;

namespace probekit::plan {

namespace {

using JsonValue = core::json::Value;

constexpr std::int64_t kMaxStatusCode = 599;
constexpr std::int64_t kMaxDurationMillis = runner::kMaxLoadDuration.count();
constexpr std::int64_t kMaxDurationSeconds = kMaxDurationMillis / 1'000;

std::string Child(const std::string& path, std::string_view key) {
  return path.empty() ? std::string(key) : path + "." + std::string(key);
}

std::string Element(const std::string& path, std::size_t index) {
  return path + "[" + std::to_string(index) + "]";
}

bool TypeError(const std::string& path, std::string_view expected, const JsonValue& actual,
               std::string& error) {
  error = path + " must be " + std::string(expected) + " (got " +
          core::json::ToString(actual.type) + ")";
  return false;
}

bool ReadOptionalString(const JsonValue& object, std::string_view key, const std::string& path,
                        std::string& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || value->is_null()) {
    return true;
  }
  if (!value->is_string()) {
    return TypeError(Child(path, key), "a string", *value, error);
  }
  out = value->string_value;
  return true;
}

bool ReadOptionalInteger(const JsonValue& object, std::string_view key, const std::string& path,
                         std::int64_t min_value, std::optional<std::int64_t>& out,
                         std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || value->is_null()) {
    return true;
  }
  if (!value->is_number() || !std::isfinite(value->number_value) ||
      std::floor(value->number_value) != value->number_value ||
      std::fabs(value->number_value) > 9.0e15) {
    return TypeError(Child(path, key), "an integer", *value, error);
  }
  const auto parsed = static_cast<std::int64_t>(value->number_value);
  if (parsed < min_value) {
    error = Child(path, key) + " must be >= " + std::to_string(min_value);
    return false;
  }
  out = parsed;
  return true;
}

// Same as ReadOptionalInteger with an upper bound, checked before any caller
// narrows the value.
bool ReadOptionalIntegerInRange(const JsonValue& object, std::string_view key,
                                const std::string& path, std::int64_t min_value,
                                std::int64_t max_value, std::optional<std::int64_t>& out,
                                std::string& error) {
  if (!ReadOptionalInteger(object, key, path, min_value, out, error)) {
    return false;
  }
  if (out.has_value() && out.value() > max_value) {
    error = Child(path, key) + " must be <= " + std::to_string(max_value);
    out.reset();
    return false;
  }
  return true;
}

bool ReadOptionalNumber(const JsonValue& object, std::string_view key, const std::string& path,
                        std::optional<double>& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || value->is_null()) {
    return true;
  }
  if (!value->is_number() || !std::isfinite(value->number_value)) {
    return TypeError(Child(path, key), "a number", *value, error);
  }
  if (value->number_value < 0.0) {
    error = Child(path, key) + " cannot be negative";
    return false;
  }
  out = value->number_value;
  return true;
}

bool ReadStringArray(const JsonValue& object, std::string_view key, const std::string& path,
                     std::vector<std::string>& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || value->is_null()) {
    return true;
  }
  const std::string field_path = Child(path, key);
  if (!value->is_array()) {
    return TypeError(field_path, "an array of strings", *value, error);
  }
  out.clear();
  for (std::size_t i = 0; i < value->array_value.size(); ++i) {
    const JsonValue& item = value->array_value[i];
    if (!item.is_string()) {
      return TypeError(Element(field_path, i), "a string", item, error);
    }
    out.push_back(item.string_value);
  }
  return true;
}

bool ReadStringMap(const JsonValue& object, std::string_view key, const std::string& path,
                   std::map<std::string, std::string>& out, std::string& error) {
  const JsonValue* value = object.Find(key);
  if (value == nullptr || value->is_null()) {
    return true;
  }
  const std::string field_path = Child(path, key);
  if (!value->is_object()) {
    return TypeError(field_path, "an object of strings", *value, error);
  }
  out.clear();
  for (const auto& [name, member] : value->object_value) {
    if (!member.is_string()) {
      return TypeError(Child(field_path, name), "a string", member, error);
    }
    out[name] = member.string_value;
  }
  return true;
}

std::chrono::microseconds MillisToMicros(double millis) {
  return std::chrono::microseconds(static_cast<std::int64_t>(std::llround(millis * 1000.0)));
}

bool ParseExpectation(const JsonValue& object, const std::string& path,
                      scenarios::Expectation& expectation, std::string& error) {
  if (!object.is_object()) {
    return TypeError(path, "an object", object, error);
  }

  std::optional<std::int64_t> status;
  if (!ReadOptionalIntegerInRange(object, "status_code", path, 0, kMaxStatusCode, status,
                                  error)) {
    return false;
  }
  if (status.has_value() && status.value() != 0) {
    expectation.status_code = static_cast<int>(status.value());
  }

  if (const JsonValue* range = object.Find("status_code_range");
      range != nullptr && !range->is_null()) {
    const std::string range_path = Child(path, "status_code_range");
    if (!range->is_object()) {
      return TypeError(range_path, "an object", *range, error);
    }
    std::optional<std::int64_t> min_status;
    std::optional<std::int64_t> max_status;
    if (!ReadOptionalIntegerInRange(*range, "min", range_path, 0, kMaxStatusCode, min_status,
                                    error) ||
        !ReadOptionalIntegerInRange(*range, "max", range_path, 0, kMaxStatusCode, max_status,
                                    error)) {
      return false;
    }
    if (!min_status.has_value() || !max_status.has_value()) {
      error = range_path + " requires both min and max";
      return false;
    }
    if (min_status.value() > max_status.value()) {
      error = range_path + " min cannot exceed max";
      return false;
    }
    expectation.status_code_range = scenarios::StatusCodeRange{
        .min = static_cast<int>(min_status.value()), .max = static_cast<int>(max_status.value())};
  }

  std::optional<std::int64_t> max_duration_ms;
  if (!ReadStringArray(object, "body_contains", path, expectation.body_contains, error) ||
      !ReadStringArray(object, "body_not_contains", path, expectation.body_not_contains, error) ||
      !ReadStringMap(object, "header_contains", path, expectation.header_contains, error) ||
      !ReadStringArray(object, "headers_not_present", path, expectation.headers_not_present,
                       error) ||
      !ReadOptionalInteger(object, "max_duration_ms", path, 0, max_duration_ms, error)) {
    return false;
  }
  if (max_duration_ms.has_value() && max_duration_ms.value() > 0) {
    expectation.max_duration_ms = static_cast<std::uint64_t>(max_duration_ms.value());
  }
  return true;
}

bool ParseRequest(const JsonValue& object, const std::string& path, std::string_view base_url,
                  probe::ProbeRequest& request, std::string& error) {
  std::string method = "GET";
  std::string url;
  if (!ReadOptionalString(object, "method", path, method, error) ||
      !ReadOptionalString(object, "url", path, url, error) ||
      !ReadStringMap(object, "headers", path, request.headers, error)) {
    return false;
  }
  if (url.empty()) {
    error = Child(path, "url") + " is required";
    return false;
  }
  std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  request.method = method;
  request.target = JoinTarget(base_url, url);

  if (const JsonValue* body = object.Find("body"); body != nullptr && !body->is_null()) {
    request.body = body->is_string() ? body->string_value : core::json::ToJsonText(*body);
  }
  return true;
}

bool ParseScenario(const JsonValue& item, std::size_t index, const std::string& path,
                   std::string_view base_url, scenarios::ScenarioDescriptor& scenario,
                   std::string& error) {
  if (!item.is_object()) {
    return TypeError(path, "an object", item, error);
  }

  if (!ReadOptionalString(item, "id", path, scenario.id, error) ||
      !ReadOptionalString(item, "name", path, scenario.name, error) ||
      !ReadOptionalString(item, "category", path, scenario.category, error) ||
      !ReadOptionalString(item, "severity", path, scenario.severity, error) ||
      !ParseRequest(item, path, base_url, scenario.request, error)) {
    return false;
  }
  if (scenario.id.empty()) {
    scenario.id = "scenario-" + std::to_string(index + 1U);
  }
  if (scenario.name.empty()) {
    scenario.name = scenario.id;
  }

  if (const JsonValue* expected = item.Find("expected"); expected != nullptr && !expected->is_null()) {
    if (!ParseExpectation(*expected, Child(path, "expected"), scenario.expectation, error)) {
      return false;
    }
  }
  return true;
}

// Targets accept the compact "METHOD /path" form as well as request objects.
bool ParseTarget(const JsonValue& item, const std::string& path, std::string_view base_url,
                 scenarios::TargetDescriptor& target, std::string& error) {
  if (item.is_string()) {
    const std::string& text = item.string_value;
    const std::size_t space = text.find(' ');
    std::string method = "GET";
    std::string url = text;
    if (space != std::string::npos) {
      method = text.substr(0, space);
      url = text.substr(space + 1U);
    }
    url.erase(0, url.find_first_not_of(' '));
    if (method.empty() || url.empty()) {
      error = path + " must look like \"METHOD /path\"";
      return false;
    }
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    target.request.method = method;
    target.request.target = JoinTarget(base_url, url);
    return true;
  }

  if (!item.is_object()) {
    return TypeError(path, "a string or an object", item, error);
  }
  if (!ParseRequest(item, path, base_url, target.request, error)) {
    return false;
  }
  if (const JsonValue* expected = item.Find("expected"); expected != nullptr && !expected->is_null()) {
    scenarios::Expectation expectation;
    if (!ParseExpectation(*expected, Child(path, "expected"), expectation, error)) {
      return false;
    }
    target.expectation = std::move(expectation);
  }
  return true;
}

bool ParseProbeConfig(const JsonValue& root, probe::sim::SimProbeConfig& config,
                      std::string& error) {
  const JsonValue* object = root.Find("probe");
  if (object == nullptr || object->is_null()) {
    return true;
  }
  const std::string path = "probe";
  if (!object->is_object()) {
    return TypeError(path, "an object", *object, error);
  }

  std::optional<std::int64_t> status;
  std::optional<std::int64_t> alt_status;
  std::optional<std::int64_t> seed;
  std::optional<std::int64_t> fail_every_n;
  std::optional<std::int64_t> alt_status_every_n;
  std::optional<double> latency_ms;
  std::optional<double> jitter_ms;
  if (!ReadOptionalIntegerInRange(*object, "status", path, 0, kMaxStatusCode, status, error) ||
      !ReadOptionalIntegerInRange(*object, "alt_status", path, 0, kMaxStatusCode, alt_status,
                                  error) ||
      !ReadOptionalInteger(*object, "seed", path, 0, seed, error) ||
      !ReadOptionalInteger(*object, "fail_every_n", path, 0, fail_every_n, error) ||
      !ReadOptionalInteger(*object, "alt_status_every_n", path, 0, alt_status_every_n, error) ||
      !ReadOptionalNumber(*object, "latency_ms", path, latency_ms, error) ||
      !ReadOptionalNumber(*object, "jitter_ms", path, jitter_ms, error) ||
      !ReadOptionalString(*object, "body", path, config.body, error) ||
      !ReadStringMap(*object, "headers", path, config.headers, error)) {
    return false;
  }

  if (status.has_value()) {
    config.status_code = static_cast<int>(status.value());
  }
  if (alt_status.has_value()) {
    config.alt_status_code = static_cast<int>(alt_status.value());
  }
  if (seed.has_value()) {
    config.seed = static_cast<std::uint64_t>(seed.value());
  }
  if (fail_every_n.has_value()) {
    config.fail_every_n = static_cast<std::uint64_t>(fail_every_n.value());
  }
  if (alt_status_every_n.has_value()) {
    config.alt_status_every_n = static_cast<std::uint64_t>(alt_status_every_n.value());
  }
  if (latency_ms.has_value()) {
    config.base_latency = MillisToMicros(latency_ms.value());
  }
  if (jitter_ms.has_value()) {
    config.max_jitter = MillisToMicros(jitter_ms.value());
  }

  return probe::sim::ValidateSimProbeConfig(config, error);
}

bool ParseRootObject(std::string_view json_text, JsonValue& root, std::string& error) {
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.is_object()) {
    error = "plan root must be a JSON object";
    return false;
  }
  return true;
}

bool ReadConcurrency(const JsonValue& root, int& concurrency, std::string& error) {
  std::optional<std::int64_t> value;
  if (!ReadOptionalInteger(root, "concurrency", "", 0, value, error)) {
    return false;
  }
  if (value.has_value()) {
    if (value.value() > 10'000) {
      error = "concurrency must be <= 10000";
      return false;
    }
    concurrency = static_cast<int>(value.value());
  }
  return true;
}

bool ReadPlanFile(const std::string& path, std::string& text, std::string& error) {
  std::error_code ec;
  if (path.empty()) {
    error = "plan path cannot be empty";
    return false;
  }
  if (!fs::is_regular_file(fs::path(path), ec) || ec) {
    error = "plan file not found: " + path;
    return false;
  }
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open plan file: " + path;
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (text.empty()) {
    error = "plan file is empty: " + path;
    return false;
  }
  return true;
}

} // namespace

std::string JoinTarget(std::string_view base_url, std::string_view path) {
  if (base_url.empty()) {
    return std::string(path);
  }
  std::string joined(base_url);
  while (!joined.empty() && joined.back() == '/') {
    joined.pop_back();
  }
  if (path.empty() || path.front() != '/') {
    joined.push_back('/');
  }
  joined.append(path);
  return joined;
}

bool ParseBatchPlanText(std::string_view json_text, BatchPlan& plan, std::string& error) {
  plan = BatchPlan{};
  error.clear();

  JsonValue root;
  if (!ParseRootObject(json_text, root, error) ||
      !ReadOptionalString(root, "base_url", "", plan.base_url, error) ||
      !ReadConcurrency(root, plan.concurrency, error) ||
      !ReadOptionalString(root, "category", "", plan.category, error) ||
      !ReadStringArray(root, "categories", "", plan.categories, error) ||
      !ParseProbeConfig(root, plan.probe, error)) {
    return false;
  }

  const JsonValue* scenarios = root.Find("scenarios");
  if (scenarios == nullptr || !scenarios->is_array()) {
    error = "scenarios must be an array";
    return false;
  }
  if (scenarios->array_value.empty()) {
    error = "scenarios must contain at least one scenario";
    return false;
  }

  std::set<std::string> seen_ids;
  plan.scenarios.reserve(scenarios->array_value.size());
  for (std::size_t i = 0; i < scenarios->array_value.size(); ++i) {
    scenarios::ScenarioDescriptor scenario;
    const std::string path = Element("scenarios", i);
    if (!ParseScenario(scenarios->array_value[i], i, path, plan.base_url, scenario, error)) {
      return false;
    }
    if (!seen_ids.insert(scenario.id).second) {
      error = path + ".id duplicates '" + scenario.id + "'";
      return false;
    }
    plan.scenarios.push_back(std::move(scenario));
  }
  return true;
}

bool ParseLoadPlanText(std::string_view json_text, LoadPlan& plan, std::string& error) {
  plan = LoadPlan{};
  error.clear();

  JsonValue root;
  std::string mode_text;
  std::optional<std::int64_t> duration_s;
  std::optional<std::int64_t> duration_ms;
  std::optional<double> rps;
  if (!ParseRootObject(json_text, root, error) ||
      !ReadOptionalString(root, "base_url", "", plan.base_url, error) ||
      !ReadOptionalString(root, "mode", "", mode_text, error) ||
      !ReadConcurrency(root, plan.concurrency, error) ||
      !ReadOptionalIntegerInRange(root, "duration_s", "", 0, kMaxDurationSeconds, duration_s,
                                  error) ||
      !ReadOptionalIntegerInRange(root, "duration_ms", "", 0, kMaxDurationMillis, duration_ms,
                                  error) ||
      !ReadOptionalNumber(root, "rps", "", rps, error) ||
      !ReadOptionalNumber(root, "min_success_rate", "", plan.min_success_rate, error) ||
      !ParseProbeConfig(root, plan.probe, error)) {
    return false;
  }

  if (!runner::ParseLoadMode(mode_text, plan.mode, error)) {
    return false;
  }
  // duration_ms wins over duration_s when both are present.
  if (duration_ms.has_value()) {
    plan.duration = std::chrono::milliseconds(duration_ms.value());
  } else if (duration_s.has_value()) {
    plan.duration = std::chrono::seconds(duration_s.value());
  }
  if (rps.has_value() && rps.value() > 0.0) {
    if (rps.value() < runner::kMinRatePerUser) {
      error =
          "rps must be 0 (unthrottled) or at least " + std::to_string(runner::kMinRatePerUser);
      return false;
    }
    plan.rate_per_user = rps;
  }
  if (plan.min_success_rate.has_value() && plan.min_success_rate.value() > 100.0) {
    error = "min_success_rate must be in [0,100]";
    return false;
  }

  const JsonValue* targets = root.Find("targets");
  if (targets == nullptr || !targets->is_array()) {
    error = "targets must be an array";
    return false;
  }
  if (targets->array_value.empty()) {
    error = "targets must contain at least one target";
    return false;
  }

  plan.targets.reserve(targets->array_value.size());
  for (std::size_t i = 0; i < targets->array_value.size(); ++i) {
    scenarios::TargetDescriptor target;
    if (!ParseTarget(targets->array_value[i], Element("targets", i), plan.base_url, target,
                     error)) {
      return false;
    }
    plan.targets.push_back(std::move(target));
  }
  return true;
}

bool ReadBatchPlanFile(const std::string& path, BatchPlan& plan, std::string& error) {
  std::string text;
  if (!ReadPlanFile(path, text, error)) {
    return false;
  }
  if (!ParseBatchPlanText(text, plan, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

bool ReadLoadPlanFile(const std::string& path, LoadPlan& plan, std::string& error) {
  std::string text;
  if (!ReadPlanFile(path, text, error)) {
    return false;
  }
  if (!ParseLoadPlanText(text, plan, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

} // namespace probekit::plan
