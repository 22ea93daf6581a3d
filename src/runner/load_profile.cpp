#include "runner/load_profile.hpp"

#include <algorithm>
#include <cctype>

namespace probekit::runner {

const char* ToString(LoadMode mode) {
  switch (mode) {
  case LoadMode::kLoad:
    return "load";
  case LoadMode::kStress:
    return "stress";
  case LoadMode::kSpike:
    return "spike";
  case LoadMode::kSoak:
    return "soak";
  }

  return "load";
}

bool ParseLoadMode(std::string_view text, LoadMode& mode, std::string& error) {
  std::string normalized(text);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized.empty() || normalized == "load") {
    mode = LoadMode::kLoad;
    return true;
  }
  if (normalized == "stress") {
    mode = LoadMode::kStress;
    return true;
  }
  if (normalized == "spike") {
    mode = LoadMode::kSpike;
    return true;
  }
  if (normalized == "soak") {
    mode = LoadMode::kSoak;
    return true;
  }

  error = "invalid load mode '" + std::string(text) + "' (expected load|stress|spike|soak)";
  return false;
}

LoadProfile ProfileFor(LoadMode mode) {
  switch (mode) {
  case LoadMode::kLoad:
    return {.mode = mode, .concurrency = 10, .duration = std::chrono::seconds(30)};
  case LoadMode::kStress:
    return {.mode = mode, .concurrency = 50, .duration = std::chrono::seconds(60)};
  case LoadMode::kSpike:
    return {.mode = mode, .concurrency = 100, .duration = std::chrono::seconds(10)};
  case LoadMode::kSoak:
    return {.mode = mode, .concurrency = 10, .duration = std::chrono::seconds(600)};
  }

  return {};
}

} // namespace probekit::runner
