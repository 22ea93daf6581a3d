#include "runner/load_profile.hpp"
#include "runner/load_runner.hpp"

#include "../common/assertions.hpp"

#include <chrono>
#include <string>

namespace {

using probekit::tests::common::AssertContains;
using probekit::tests::common::Fail;

} // namespace

int main() {
  using probekit::runner::ApplyProfile;
  using probekit::runner::LoadMode;
  using probekit::runner::LoadRunConfig;
  using probekit::runner::ParseLoadMode;
  using probekit::runner::ProfileFor;

  struct Preset {
    LoadMode mode;
    int concurrency;
    long long seconds;
  };
  const Preset presets[] = {
      {LoadMode::kLoad, 10, 30},
      {LoadMode::kStress, 50, 60},
      {LoadMode::kSpike, 100, 10},
      {LoadMode::kSoak, 10, 600},
  };
  for (const Preset& preset : presets) {
    const auto profile = ProfileFor(preset.mode);
    if (profile.concurrency != preset.concurrency || profile.duration.count() != preset.seconds) {
      Fail(std::string("unexpected preset for mode ") + probekit::runner::ToString(preset.mode));
    }
  }

  {
    LoadMode mode = LoadMode::kLoad;
    std::string error;
    if (!ParseLoadMode("Spike", mode, error) || mode != LoadMode::kSpike) {
      Fail("expected case-insensitive mode parsing");
    }
    if (!ParseLoadMode("", mode, error) || mode != LoadMode::kLoad) {
      Fail("expected empty mode to mean load");
    }
    if (ParseLoadMode("burst", mode, error)) {
      Fail("expected unknown mode to be rejected");
    }
    AssertContains(error, "load|stress|spike|soak");
  }

  {
    // Unset values come from the preset; explicit ones win.
    LoadRunConfig config;
    config = ApplyProfile(LoadMode::kStress, config);
    if (config.concurrency != 50 || config.duration != std::chrono::seconds(60) ||
        config.mode != LoadMode::kStress) {
      Fail("expected stress preset to fill unset values");
    }

    LoadRunConfig explicit_config;
    explicit_config.concurrency = 7;
    explicit_config.duration = std::chrono::milliseconds(1'500);
    explicit_config = ApplyProfile(LoadMode::kSoak, explicit_config);
    if (explicit_config.concurrency != 7 ||
        explicit_config.duration != std::chrono::milliseconds(1'500)) {
      Fail("explicit values must override preset values");
    }
  }

  return 0;
}
