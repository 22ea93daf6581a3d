#include "probe/sim_probe.hpp"

#include <thread>

namespace probekit::probe::sim {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

bool Hits(std::uint64_t sequence, std::uint64_t every_n) {
  return every_n > 0U && sequence % every_n == 0U;
}

} // namespace

bool ValidateSimProbeConfig(const SimProbeConfig& config, std::string& error) {
  if (config.status_code < 100 || config.status_code > 599) {
    error = "sim probe status must be in [100,599]";
    return false;
  }
  if (config.alt_status_code < 100 || config.alt_status_code > 599) {
    error = "sim probe alt_status must be in [100,599]";
    return false;
  }
  if (config.base_latency < std::chrono::microseconds::zero() ||
      config.max_jitter < std::chrono::microseconds::zero()) {
    error = "sim probe latency and jitter cannot be negative";
    return false;
  }
  return true;
}

std::chrono::microseconds SimProbe::LatencyFor(const std::uint64_t sequence) const {
  if (config_.max_jitter <= std::chrono::microseconds::zero()) {
    return config_.base_latency;
  }

  // Jitter is symmetric around the base latency and never drives it below 0.
  const auto max_abs = static_cast<std::uint64_t>(config_.max_jitter.count());
  const std::uint64_t mixed = SplitMix64(config_.seed ^ (sequence * kSplitMixIncrement));
  const auto offset = static_cast<std::int64_t>(mixed % (max_abs * 2U + 1U)) -
                      static_cast<std::int64_t>(max_abs);
  const std::int64_t latency_us = config_.base_latency.count() + offset;
  return std::chrono::microseconds(latency_us < 0 ? 0 : latency_us);
}

bool SimProbe::Invoke(const ProbeRequest& request, ProbeResponse& response, std::string& error) {
  const std::uint64_t sequence = calls_.fetch_add(1U, std::memory_order_relaxed) + 1U;
  const std::chrono::microseconds latency = LatencyFor(sequence);
  if (latency > std::chrono::microseconds::zero()) {
    std::this_thread::sleep_for(latency);
  }

  if (Hits(sequence, config_.fail_every_n)) {
    error = "simulated connection reset on call " + std::to_string(sequence) + " to " +
            request.method + " " + request.target;
    return false;
  }

  response = ProbeResponse{};
  response.status_code =
      Hits(sequence, config_.alt_status_every_n) ? config_.alt_status_code : config_.status_code;
  response.body = config_.body;
  response.headers = config_.headers;
  response.latency = latency;
  return true;
}

} // namespace probekit::probe::sim
