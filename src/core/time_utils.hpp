#ifndef PROBEKIT_CORE_TIME_UTILS_HPP_
#define PROBEKIT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <string>

namespace probekit::core {

// UTC calendar breakdown of `seconds`. Returns false when the platform call
// fails (out-of-range time_t).
inline bool ToUtcCalendar(std::time_t seconds, std::tm& out) {
#if defined(_WIN32)
  return gmtime_s(&out, &seconds) == 0;
#else
  return gmtime_r(&seconds, &out) != nullptr;
#endif
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
// Shared by log lines and report headers. Empty on conversion failure.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
  auto whole_seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto millis = (since_epoch - whole_seconds).count();

  std::tm utc{};
  if (!ToUtcCalendar(static_cast<std::time_t>(whole_seconds.count()), utc)) {
    return "";
  }

  char text[32];
  const int written = std::snprintf(text, sizeof(text), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                                    utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                                    utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(text)) {
    return "";
  }
  return std::string(text, static_cast<std::size_t>(written));
}

// Latency values travel as microseconds internally and are reported in
// milliseconds with sub-millisecond precision.
inline double ToMillis(std::chrono::microseconds value) {
  return static_cast<double>(value.count()) / 1000.0;
}

inline std::chrono::microseconds MicrosSince(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace probekit::core

#endif // PROBEKIT_CORE_TIME_UTILS_HPP_
