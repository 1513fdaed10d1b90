#pragma once

#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace camlight::core::logging {

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

const char* ToString(LogLevel level);

// "debug|info|warn|error", used in usage text and parse errors.
std::string ExpectedLogLevelList();

// Case-insensitive; "warning" is accepted as an alias for warn.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// Line-oriented key=value logger:
//   ts_utc=2026-01-02T03:04:05.678Z level=INFO component="camlight" msg="..." k="v"
//
// The coordinator worker, the signal source thread and the session driver all
// hold the same instance, so a whole line is formatted first and then written
// under `mu_`.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {});

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
  std::mutex mu_;
  const LogLevel min_level_;
  std::ostream* out_;
};

} // namespace camlight::core::logging
