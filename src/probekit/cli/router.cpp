#include "probekit/cli/router.hpp"

#include "artifacts/result_json.hpp"
#include "artifacts/summary_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "probe/sim_probe.hpp"
#include "probekit/plan/plan_loader.hpp"
#include "runner/batch_runner.hpp"
#include "runner/load_profile.hpp"
#include "runner/load_runner.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace probekit::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitPlanInvalid = core::errors::ToInt(core::errors::ExitCode::kPlanInvalid);
constexpr int kExitChecksFailed = core::errors::ToInt(core::errors::ExitCode::kChecksFailed);

// Set from the SIGINT handler, consumed by the load watcher thread.
std::atomic<bool> g_interrupt_requested{false};

extern "C" void HandleInterrupt(int /*signal*/) {
  g_interrupt_requested.store(true);
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  probekit batch <plan.json> [--concurrency <n>] [--category <name>] [--json] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  probekit load <plan.json> [--mode <load|stress|spike|soak>] [--concurrency <n>] "
         "[--duration-s <s>] [--rps <per-user>] [--json] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  probekit validate <batch|load> <plan.json>\n"
      << "  probekit version\n";
}

std::string MakeRunId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "run-" + std::to_string(millis);
}

bool ValidatePlanPath(const std::string& plan_path, std::string& error) {
  if (plan_path.empty()) {
    error = "plan path cannot be empty";
    return false;
  }

  const fs::path path(plan_path);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "plan file not found: " + plan_path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "plan path must point to a regular file: " + plan_path;
    return false;
  }
  if (path.extension() != ".json") {
    error = "plan file must use .json extension: " + plan_path;
    return false;
  }
  return true;
}

bool ParseIntFlag(std::string_view flag, std::string_view text, int& value, std::string& error) {
  int parsed = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    error = "invalid integer for " + std::string(flag) + ": " + std::string(text);
    return false;
  }
  value = parsed;
  return true;
}

bool ParseDoubleFlag(std::string_view flag, std::string_view text, double& value,
                     std::string& error) {
  const std::string owned(text);
  char* end = nullptr;
  const double parsed = std::strtod(owned.c_str(), &end);
  if (owned.empty() || end == nullptr || *end != '\0' || !std::isfinite(parsed) || parsed < 0.0) {
    error = "invalid non-negative number for " + std::string(flag) + ": " + owned;
    return false;
  }
  value = parsed;
  return true;
}

// Pulls the value that follows `args[i]`, advancing `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

bool TakeLogLevel(const std::vector<std::string_view>& args, std::size_t& i,
                  core::logging::LogLevel& level, std::string& error) {
  std::string_view value;
  return TakeValue(args, i, value, error) && core::logging::ParseLogLevel(value, level, error);
}

bool SetPlanPath(std::string_view command, std::string_view token, std::string& plan_path,
                 std::string& error) {
  if (!token.empty() && token.front() == '-') {
    error = "unknown option: " + std::string(token);
    return false;
  }
  if (!plan_path.empty()) {
    error = std::string(command) + " accepts exactly 1 plan path";
    return false;
  }
  plan_path = std::string(token);
  return true;
}

bool ParseBatchOptions(const std::vector<std::string_view>& args, BatchOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--json") {
      options.json_output = true;
      continue;
    }
    if (token == "--concurrency") {
      int parsed = 0;
      if (!TakeValue(args, i, value, error) ||
          !ParseIntFlag("--concurrency", value, parsed, error)) {
        return false;
      }
      options.concurrency = parsed;
      continue;
    }
    if (token == "--category") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.category = std::string(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!SetPlanPath("batch", token, options.plan_path, error)) {
      return false;
    }
  }

  if (options.plan_path.empty()) {
    error = "batch requires exactly 1 argument: <plan.json>";
    return false;
  }
  return true;
}

bool ParseLoadOptions(const std::vector<std::string_view>& args, LoadOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--json") {
      options.json_output = true;
      continue;
    }
    if (token == "--mode") {
      runner::LoadMode ignored = runner::LoadMode::kLoad;
      if (!TakeValue(args, i, value, error) || !runner::ParseLoadMode(value, ignored, error)) {
        return false;
      }
      options.mode = std::string(value);
      continue;
    }
    if (token == "--concurrency") {
      int parsed = 0;
      if (!TakeValue(args, i, value, error) ||
          !ParseIntFlag("--concurrency", value, parsed, error)) {
        return false;
      }
      options.concurrency = parsed;
      continue;
    }
    if (token == "--duration-s") {
      double parsed = 0.0;
      if (!TakeValue(args, i, value, error) ||
          !ParseDoubleFlag("--duration-s", value, parsed, error)) {
        return false;
      }
      if (parsed * 1000.0 > static_cast<double>(runner::kMaxLoadDuration.count())) {
        error = "--duration-s must be <= " +
                std::to_string(runner::kMaxLoadDuration.count() / 1'000) + ": " +
                std::string(value);
        return false;
      }
      options.duration_s = parsed;
      continue;
    }
    if (token == "--rps") {
      double parsed = 0.0;
      if (!TakeValue(args, i, value, error) || !ParseDoubleFlag("--rps", value, parsed, error)) {
        return false;
      }
      if (parsed > 0.0 && parsed < runner::kMinRatePerUser) {
        error = "--rps must be 0 (unthrottled) or at least " +
                std::to_string(runner::kMinRatePerUser) + ": " + std::string(value);
        return false;
      }
      options.rate_per_user = parsed;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeLogLevel(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!SetPlanPath("load", token, options.plan_path, error)) {
      return false;
    }
  }

  if (options.plan_path.empty()) {
    error = "load requires exactly 1 argument: <plan.json>";
    return false;
  }
  return true;
}

// Installs the SIGINT handler for the lifetime of one load run and forwards
// an interrupt to the runner. Signal handlers may only touch lock-free
// atomics, so a watcher thread does the actual Cancel call.
class InterruptForwarder {
public:
  explicit InterruptForwarder(runner::DurationLoadRunner& runner) : runner_(runner) {
    g_interrupt_requested.store(false);
    previous_ = std::signal(SIGINT, HandleInterrupt);
    watcher_ = std::thread([this] {
      while (!done_.load()) {
        if (g_interrupt_requested.exchange(false)) {
          runner_.Cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }

  ~InterruptForwarder() {
    done_.store(true);
    if (watcher_.joinable()) {
      watcher_.join();
    }
    std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
  }

  InterruptForwarder(const InterruptForwarder&) = delete;
  InterruptForwarder& operator=(const InterruptForwarder&) = delete;

private:
  runner::DurationLoadRunner& runner_;
  std::atomic<bool> done_{false};
  std::thread watcher_;
  void (*previous_)(int) = SIG_DFL;
};

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "probekit 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 2U || (args[0] != "batch" && args[0] != "load")) {
    std::cerr << "error: validate requires <batch|load> <plan.json>\n";
    return kExitUsage;
  }

  const std::string plan_path(args[1]);
  std::string error;
  if (!ValidatePlanPath(plan_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::size_t entries = 0;
  if (args[0] == "batch") {
    plan::BatchPlan batch_plan;
    if (!plan::ReadBatchPlanFile(plan_path, batch_plan, error)) {
      std::cerr << "invalid plan: " << error << '\n';
      return kExitPlanInvalid;
    }
    entries = batch_plan.scenarios.size();
  } else {
    plan::LoadPlan load_plan;
    if (!plan::ReadLoadPlanFile(plan_path, load_plan, error)) {
      std::cerr << "invalid plan: " << error << '\n';
      return kExitPlanInvalid;
    }
    entries = load_plan.targets.size();
  }

  std::cout << "valid: " << plan_path << " (" << entries << " entries)\n";
  return kExitSuccess;
}

int CommandBatch(const std::vector<std::string_view>& args) {
  BatchOptions options;
  std::string error;
  if (!ParseBatchOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteBatch(options);
}

int CommandLoad(const std::vector<std::string_view>& args) {
  LoadOptions options;
  std::string error;
  if (!ParseLoadOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteLoad(options);
}

} // namespace

int ExecuteBatch(const BatchOptions& options) {
  core::logging::Logger logger(options.log_level);
  std::string error;
  if (!ValidatePlanPath(options.plan_path, error)) {
    logger.Error("batch plan rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  plan::BatchPlan batch_plan;
  if (!plan::ReadBatchPlanFile(options.plan_path, batch_plan, error)) {
    logger.Error("batch plan invalid", {{"error", error}});
    std::cerr << "invalid plan: " << error << '\n';
    return kExitPlanInvalid;
  }

  const auto started_at = std::chrono::system_clock::now();
  logger.SetRunId(MakeRunId(started_at));

  runner::BatchOptions run_options;
  run_options.concurrency = options.concurrency.value_or(batch_plan.concurrency);
  run_options.category = options.category.value_or(batch_plan.category);
  run_options.categories = batch_plan.categories;
  if (logger.ShouldLog(core::logging::LogLevel::kDebug)) {
    run_options.on_outcome = [&logger](std::size_t index,
                                       const metrics::InvocationOutcome& outcome) {
      logger.Debug("scenario finished", {{"index", std::to_string(index)},
                                         {"scenario_id", outcome.scenario_id},
                                         {"passed", outcome.success ? "true" : "false"}});
    };
  }

  probe::sim::SimProbe probe(batch_plan.probe);
  const runner::BoundedBatchRunner batch_runner(probe, &logger);
  runner::BatchRunResult result;
  if (!batch_runner.Run(batch_plan.scenarios, run_options, result, error)) {
    logger.Error("batch run rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const artifacts::RunHeader header{.run_id = logger.RunId(),
                                    .kind = "batch",
                                    .started_at = started_at,
                                    .finished_at = std::chrono::system_clock::now()};
  if (options.json_output) {
    std::cout << artifacts::BatchReportJson(header, result) << '\n';
  } else {
    std::cout << artifacts::FormatBatchSummary(result);
  }

  return result.metrics.fail == 0U ? kExitSuccess : kExitChecksFailed;
}

int ExecuteLoad(const LoadOptions& options) {
  core::logging::Logger logger(options.log_level);
  std::string error;
  if (!ValidatePlanPath(options.plan_path, error)) {
    logger.Error("load plan rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  plan::LoadPlan load_plan;
  if (!plan::ReadLoadPlanFile(options.plan_path, load_plan, error)) {
    logger.Error("load plan invalid", {{"error", error}});
    std::cerr << "invalid plan: " << error << '\n';
    return kExitPlanInvalid;
  }

  runner::LoadMode mode = load_plan.mode;
  if (options.mode.has_value() && !runner::ParseLoadMode(options.mode.value(), mode, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  runner::LoadRunConfig config;
  config.concurrency = options.concurrency.value_or(load_plan.concurrency);
  config.duration = load_plan.duration;
  if (options.duration_s.has_value()) {
    config.duration = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::llround(options.duration_s.value() * 1000.0)));
  }
  config.rate_per_user =
      options.rate_per_user.has_value() ? options.rate_per_user : load_plan.rate_per_user;
  config = runner::ApplyProfile(mode, config);

  const auto started_at = std::chrono::system_clock::now();
  logger.SetRunId(MakeRunId(started_at));

  probe::sim::SimProbe probe(load_plan.probe);
  runner::DurationLoadRunner load_runner(probe, &logger);
  runner::LoadRunResult result;
  bool ran = false;
  {
    InterruptForwarder forwarder(load_runner);
    ran = load_runner.Run(load_plan.targets, config, result, error);
  }
  if (!ran) {
    logger.Error("load run rejected", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const artifacts::RunHeader header{.run_id = logger.RunId(),
                                    .kind = "load",
                                    .started_at = started_at,
                                    .finished_at = std::chrono::system_clock::now()};
  if (options.json_output) {
    std::cout << artifacts::LoadReportJson(header, result) << '\n';
  } else {
    std::cout << artifacts::FormatLoadSummary(result);
  }

  if (load_plan.min_success_rate.has_value() &&
      result.metrics.success_rate < load_plan.min_success_rate.value()) {
    logger.Warn("load success rate below plan minimum",
                {{"success_rate", std::to_string(result.metrics.success_rate)},
                 {"min_success_rate", std::to_string(load_plan.min_success_rate.value())}});
    return kExitChecksFailed;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "batch") {
    return CommandBatch(args);
  }
  if (command == "load") {
    return CommandLoad(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace probekit::cli
