#pragma once

#include "core/logging/logger.hpp"

#include <optional>
#include <string>

namespace probekit::cli {

// Options shared by `probekit batch` and in-process callers.
struct BatchOptions {
  std::string plan_path;
  std::optional<int> concurrency;
  std::optional<std::string> category;
  bool json_output = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Options shared by `probekit load` and in-process callers. Flag values
// override the plan file.
struct LoadOptions {
  std::string plan_path;
  std::optional<std::string> mode;
  std::optional<int> concurrency;
  std::optional<double> duration_s;
  std::optional<double> rate_per_user;
  bool json_output = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Executes a batch plan against the simulated probe and prints the report.
// Returns a process exit code (see core/errors/exit_codes.hpp).
int ExecuteBatch(const BatchOptions& options);

// Executes a load plan against the simulated probe and prints the report.
// SIGINT cancels the run cooperatively; metrics for completed calls are still
// reported.
int ExecuteLoad(const LoadOptions& options);

// Routes `probekit` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => plan file invalid
//   30 => run finished but its pass criteria were not met
int Dispatch(int argc, char** argv);

} // namespace probekit::cli
