#pragma once

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace probekit::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

// Accepts the names in ExpectedLogLevelList() in any case, plus "warning".
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  struct NamedLevel {
    std::string_view name;
    LogLevel level;
  };
  static constexpr NamedLevel kLevels[] = {
      {"debug", LogLevel::kDebug}, {"info", LogLevel::kInfo},   {"warn", LogLevel::kWarn},
      {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
  };

  error.clear();
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto& entry : kLevels) {
    if (normalized == entry.name) {
      level = entry.level;
      return true;
    }
  }

  error = raw.empty() ? "missing value for --log-level"
                      : "invalid --log-level '" + std::string(raw) + "'";
  error += " (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// Structured key=value logger:
//   ts_utc=... level=INFO run_id="run-1" msg="load run started" mode="spike"
//
// Virtual users log from their own threads, so each line is formatted into a
// local buffer first and written to the sink under one lock. Lines from
// different workers never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetRunId(std::string run_id) {
    std::lock_guard<std::mutex> lock(mu_);
    run_id_ = std::move(run_id);
  }

  std::string RunId() const {
    std::lock_guard<std::mutex> lock(mu_);
    return run_id_;
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return Enabled(level);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!Enabled(level)) {
      return;
    }

    std::string line = "ts_utc=" + core::FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    AppendField(line, "run_id", run_id_);
    AppendField(line, "msg", message);
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    out_->write(line.data(), static_cast<std::streamsize>(line.size()));
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  bool Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  // Values are always quoted with JSON escaping so a line stays on one line
  // and splits unambiguously on unquoted spaces.
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line += "=\"";
    core::AppendEscapedJson(line, value);
    line.push_back('"');
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string run_id_ = "-";
};

// Runners take an optional logger. This keeps call sites free of null checks.
inline void LogIf(Logger* logger, LogLevel level, std::string_view message,
                  std::initializer_list<LogFieldView> fields = {}) {
  if (logger != nullptr) {
    logger->Log(level, message, fields);
  }
}

} // namespace probekit::core::logging
