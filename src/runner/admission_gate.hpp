#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace probekit::runner {

// Counting semaphore that bounds simultaneous in-flight invocations.
//
// Besides the token count the gate tracks how many holders it has right now
// and the highest number it ever had at once. The peak value lets callers
// confirm the concurrency ceiling held for a whole batch.
class AdmissionGate {
public:
  // A capacity of 0 is treated as 1 so Acquire can never block forever.
  explicit AdmissionGate(std::size_t capacity);

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  // Blocks until a token is available.
  void Acquire();

  // Returns a token. Releasing more than was acquired is ignored.
  void Release();

  std::size_t capacity() const {
    return capacity_;
  }

  std::size_t in_flight() const;
  std::size_t peak_in_flight() const;
  std::uint64_t admitted_total() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::size_t in_flight_ = 0;
  std::size_t peak_in_flight_ = 0;
  std::uint64_t admitted_total_ = 0;
};

// Holds one gate token for its lifetime, so the token is returned on every
// exit path of the invocation that owns it.
class AdmissionTicket {
public:
  explicit AdmissionTicket(AdmissionGate& gate) : gate_(gate) {
    gate_.Acquire();
  }
  ~AdmissionTicket() {
    gate_.Release();
  }

  AdmissionTicket(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(const AdmissionTicket&) = delete;
  AdmissionTicket(AdmissionTicket&&) = delete;
  AdmissionTicket& operator=(AdmissionTicket&&) = delete;

private:
  AdmissionGate& gate_;
};

} // namespace probekit::runner
