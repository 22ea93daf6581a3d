#pragma once

#include "probe/probe.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace probekit::probe::sim {

// Knobs for the simulated target. All fault patterns are keyed on the global
// call sequence number, so a single-threaded caller sees the same responses
// on every run with the same seed.
struct SimProbeConfig {
  int status_code = 200;
  std::string body = "{\"ok\":true}";
  HeaderMap headers = {{"Content-Type", "application/json"}};

  // Simulated service time. The probe really waits this long (plus jitter) so
  // concurrency and throughput behave like a real remote call.
  std::chrono::microseconds base_latency{0};
  std::chrono::microseconds max_jitter{0};
  std::uint64_t seed = 1;

  // Every Nth call (1-based) fails at transport level. 0 disables.
  std::uint64_t fail_every_n = 0;
  // Every Nth call (1-based) answers with `alt_status_code`. 0 disables.
  std::uint64_t alt_status_every_n = 0;
  int alt_status_code = 500;
};

// Deterministic, network-free probe used by the CLI and tests.
class SimProbe final : public IProbe {
public:
  SimProbe() = default;
  explicit SimProbe(SimProbeConfig config) : config_(std::move(config)) {}

  bool Invoke(const ProbeRequest& request, ProbeResponse& response, std::string& error) override;

  std::uint64_t calls() const {
    return calls_.load(std::memory_order_relaxed);
  }

  const SimProbeConfig& config() const {
    return config_;
  }

private:
  std::chrono::microseconds LatencyFor(std::uint64_t sequence) const;

  SimProbeConfig config_;
  std::atomic<std::uint64_t> calls_{0};
};

// Validates knob ranges before a SimProbe is built from untrusted input.
bool ValidateSimProbeConfig(const SimProbeConfig& config, std::string& error);

} // namespace probekit::probe::sim
