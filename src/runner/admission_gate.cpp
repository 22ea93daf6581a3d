#include "runner/admission_gate.hpp"

#include <algorithm>

namespace probekit::runner {

AdmissionGate::AdmissionGate(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1U)) {}

void AdmissionGate::Acquire() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return in_flight_ < capacity_; });
  ++in_flight_;
  ++admitted_total_;
  peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
}

void AdmissionGate::Release() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (in_flight_ == 0U) {
      return;
    }
    --in_flight_;
  }
  cv_.notify_one();
}

std::size_t AdmissionGate::in_flight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_;
}

std::size_t AdmissionGate::peak_in_flight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return peak_in_flight_;
}

std::uint64_t AdmissionGate::admitted_total() const {
  std::lock_guard<std::mutex> lock(mu_);
  return admitted_total_;
}

} // namespace probekit::runner
