#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <string>

namespace {

using probekit::tests::common::AssertContains;
using probekit::tests::common::AssertNotContains;
using probekit::tests::common::DispatchCaptured;
using probekit::tests::common::Fail;

void ExpectExit(int actual, int expected, const std::string& what, const std::string& out,
                const std::string& err) {
  if (actual == expected) {
    return;
  }
  Fail(what + ": expected exit " + std::to_string(expected) + ", got " + std::to_string(actual) +
       "\nstdout:\n" + out + "\nstderr:\n" + err);
}

} // namespace

int main() {
  using probekit::tests::common::CreateUniqueTempDir;
  using probekit::tests::common::RemovePathBestEffort;
  using probekit::tests::common::WriteFixtureFile;

  const auto root = CreateUniqueTempDir("probekit-cli-dispatch");
  std::string out;
  std::string err;

  {
    ExpectExit(DispatchCaptured({"probekit"}, out, err), 2, "no subcommand", out, err);
    AssertContains(err, "usage:");
    ExpectExit(DispatchCaptured({"probekit", "explode"}, out, err), 2, "unknown subcommand", out,
               err);
    AssertContains(err, "unknown subcommand: explode");
    ExpectExit(DispatchCaptured({"probekit", "version"}, out, err), 0, "version", out, err);
    AssertContains(out, "probekit 0.1.0");
    ExpectExit(DispatchCaptured({"probekit", "help"}, out, err), 0, "help", out, err);
    AssertContains(out, "probekit load <plan.json>");
  }

  const auto passing_plan = root / "batch_pass.json";
  WriteFixtureFile(passing_plan, R"({
    "concurrency": 2,
    "scenarios": [
      {"id": "home", "name": "Home page", "category": "functional", "url": "/",
       "expected": {"status_code": 200, "body_contains": ["ok"]}},
      {"id": "admin", "name": "Admin hidden", "category": "security", "url": "/admin",
       "expected": {"status_code": 200}}
    ]
  })");

  {
    ExpectExit(DispatchCaptured({"probekit", "batch", passing_plan.string()}, out, err), 0,
               "passing batch", out, err);
    AssertContains(out, "PASS [functional] Home page");
    AssertContains(out, "Summary: 2 Passed, 0 Failed");
    AssertContains(err, "msg=\"batch finished\"");

    ExpectExit(DispatchCaptured({"probekit", "batch", passing_plan.string(), "--category",
                                 "security", "--json", "--log-level", "error"},
                                out, err),
               0, "filtered json batch", out, err);
    AssertContains(out, "\"kind\":\"batch\"");
    AssertContains(out, "\"skipped\":1");
    AssertContains(out, "\"scenario_id\":\"admin\"");
    AssertNotContains(out, "\"scenario_id\":\"home\"");
    AssertNotContains(err, "batch finished");
  }

  {
    // Every second call answers 404, so one of two scenarios fails checks.
    const auto failing_plan = root / "batch_fail.json";
    WriteFixtureFile(failing_plan, R"({
      "concurrency": 1,
      "probe": {"alt_status": 404, "alt_status_every_n": 2},
      "scenarios": [
        {"id": "a", "name": "First", "url": "/a", "expected": {"status_code": 200}},
        {"id": "b", "name": "Second", "url": "/b", "expected": {"status_code": 200}}
      ]
    })");
    ExpectExit(DispatchCaptured({"probekit", "batch", failing_plan.string()}, out, err), 30,
               "failing batch", out, err);
    AssertContains(out, "FAIL [] Second");
    AssertContains(out, "Status: Expected 200, Got 404");
    AssertContains(out, "Summary: 1 Passed, 1 Failed");
  }

  {
    ExpectExit(DispatchCaptured({"probekit", "batch"}, out, err), 2, "batch without plan", out,
               err);
    ExpectExit(DispatchCaptured({"probekit", "batch", passing_plan.string(), "--concurrency"},
                                out, err),
               2, "missing flag value", out, err);
    AssertContains(err, "missing value for --concurrency");
    ExpectExit(DispatchCaptured({"probekit", "batch", passing_plan.string(), "--bogus"}, out,
                                err),
               2, "unknown flag", out, err);
    AssertContains(err, "unknown option: --bogus");
    ExpectExit(DispatchCaptured({"probekit", "batch", (root / "missing.json").string()}, out,
                                err),
               1, "missing plan", out, err);
    AssertContains(err, "plan file not found");

    const auto invalid_plan = root / "invalid.json";
    WriteFixtureFile(invalid_plan, R"({"scenarios": "nope"})");
    ExpectExit(DispatchCaptured({"probekit", "batch", invalid_plan.string()}, out, err), 10,
               "invalid plan", out, err);
    AssertContains(err, "scenarios must be an array");
    ExpectExit(DispatchCaptured({"probekit", "validate", "batch", invalid_plan.string()}, out,
                                err),
               10, "validate invalid plan", out, err);
    ExpectExit(DispatchCaptured({"probekit", "validate", "batch", passing_plan.string()}, out,
                                err),
               0, "validate valid plan", out, err);
    AssertContains(out, "(2 entries)");
  }

  {
    const auto load_plan = root / "load.json";
    WriteFixtureFile(load_plan, R"({
      "mode": "spike", "concurrency": 2, "duration_ms": 300,
      "probe": {"latency_ms": 1},
      "targets": ["GET /health", {"method": "GET", "url": "/users"}]
    })");
    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string()}, out, err), 0,
               "load run", out, err);
    AssertContains(out, "Performance Test Complete (Mode: spike)");
    AssertContains(out, "Virtual users: 2, duration: 300ms");
    AssertContains(out, "p99:");

    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string(), "--mode", "soak",
                                 "--duration-s", "0.2", "--concurrency", "3", "--json"},
                                out, err),
               0, "load json with overrides", out, err);
    AssertContains(out, "\"mode\":\"soak\"");
    AssertContains(out, "\"concurrency\":3");
    AssertContains(out, "\"duration_ms\":200");
    AssertContains(out, "\"workers_joined\":3");

    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string(), "--mode", "burst"}, out,
                                err),
               2, "invalid mode flag", out, err);
    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string(), "--rps", "-3"}, out,
                                err),
               2, "negative rps flag", out, err);
    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string(), "--duration-s", "1e300"},
                                out, err),
               2, "oversized duration flag", out, err);
    AssertContains(err, "--duration-s must be <= 86400");
    ExpectExit(DispatchCaptured({"probekit", "load", load_plan.string(), "--rps", "1e-13"}, out,
                                err),
               2, "vanishing rps flag", out, err);
    AssertContains(err, "--rps must be 0 (unthrottled) or at least");
  }

  {
    // Half the calls answer 500 while the plan demands 99% success.
    const auto strict_plan = root / "load_strict.json";
    WriteFixtureFile(strict_plan, R"({
      "concurrency": 1, "duration_ms": 200, "min_success_rate": 99,
      "probe": {"latency_ms": 1, "alt_status": 500, "alt_status_every_n": 2},
      "targets": ["GET /health"]
    })");
    ExpectExit(DispatchCaptured({"probekit", "load", strict_plan.string()}, out, err), 30,
               "load below success threshold", out, err);
    AssertContains(err, "load success rate below plan minimum");
  }

  RemovePathBestEffort(root);
  return 0;
}
