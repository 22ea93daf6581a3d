#pragma once

#include <chrono>
#include <map>
#include <string>

namespace probekit::probe {

using HeaderMap = std::map<std::string, std::string>;

// One fully-resolved request handed to a probe. The engine never interprets
// `target`; it is whatever the probe implementation knows how to reach.
struct ProbeRequest {
  std::string method = "GET";
  std::string target;
  HeaderMap headers;
  std::string body;
};

// Observed response for a single invocation.
//
// `latency` is what the probe measured for the call. A zero latency means the
// probe did not measure it, and the runner falls back to its own wall-clock
// measurement around the call.
struct ProbeResponse {
  int status_code = 0;
  std::string body;
  HeaderMap headers;
  std::chrono::microseconds latency{0};
};

// Caller-supplied network call contract.
//
// Contract:
// - Invoke may be called concurrently from any number of runner workers, so
//   implementations must be thread-safe.
// - true: the call completed and `response` describes what came back, whatever
//   the status code.
// - false: transport-level failure; `error` explains why. The runner records a
//   failed outcome and carries on with the remaining work.
// - Retries, backoff and authentication are the implementation's business.
class IProbe {
public:
  virtual ~IProbe() = default;

  virtual bool Invoke(const ProbeRequest& request, ProbeResponse& response,
                      std::string& error) = 0;
};

} // namespace probekit::probe
