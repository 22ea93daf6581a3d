#pragma once

namespace probekit::core::errors {

// Stable process-exit contract for CLI automation.
//
// - 0 success
// - 1 generic command failure (plan could not be executed)
// - 2 usage/argument failure
//
// The remaining values let CI wrappers tell a malformed plan apart from a run
// that executed but did not meet its pass criteria.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kPlanInvalid = 10,
  kChecksFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace probekit::core::errors
