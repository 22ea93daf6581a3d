#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace probekit::runner {

// Named load shapes. They are presets over one duration-bound runner, not
// separate algorithms.
enum class LoadMode {
  kLoad,
  kStress,
  kSpike,
  kSoak,
};

struct LoadProfile {
  LoadMode mode = LoadMode::kLoad;
  int concurrency = 10;
  std::chrono::seconds duration{30};
};

const char* ToString(LoadMode mode);

// Accepts load|stress|spike|soak (case-insensitive). Empty text means load.
bool ParseLoadMode(std::string_view text, LoadMode& mode, std::string& error);

// Preset values:
// - load:   10 users, 30s
// - stress: 50 users, 60s
// - spike: 100 users, 10s
// - soak:   10 users, 600s
LoadProfile ProfileFor(LoadMode mode);

} // namespace probekit::runner
