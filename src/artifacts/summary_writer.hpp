#pragma once

#include "runner/batch_runner.hpp"
#include "runner/load_runner.hpp"

#include <string>

namespace probekit::artifacts {

// Human-readable batch summary: one line per scenario in input order, failure
// details indented under failed scenarios, then a pass/fail total.
std::string FormatBatchSummary(const runner::BatchRunResult& result);

// Human-readable load summary: request counts, success rate, throughput and
// the latency distribution.
std::string FormatLoadSummary(const runner::LoadRunResult& result);

} // namespace probekit::artifacts
