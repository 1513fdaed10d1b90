#include "core/logging/logger.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace camlight::core::logging {

namespace {

struct LevelName {
  LogLevel level;
  std::string_view lower;
  const char* upper;
};

constexpr std::array<LevelName, 4> kLevels = {{
    {LogLevel::kDebug, "debug", "DEBUG"},
    {LogLevel::kInfo, "info", "INFO"},
    {LogLevel::kWarn, "warn", "WARN"},
    {LogLevel::kError, "error", "ERROR"},
}};

char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (AsciiLower(lhs[i]) != AsciiLower(rhs[i])) {
      return false;
    }
  }
  return true;
}

// RFC 3339 with millisecond precision. Empty when the clock is out of range
// for gmtime_r.
std::string UtcTimestampNow() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  const auto now = std::chrono::system_clock::now();
  const auto whole_seconds = std::chrono::floor<seconds>(now);
  const auto millis = duration_cast<milliseconds>(now - whole_seconds).count();

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(whole_seconds);
  std::tm utc{};
  if (gmtime_r(&epoch_seconds, &utc) == nullptr) {
    return "";
  }

  char buffer[32];
  const int written = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                                    utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                                    utc.tm_min, utc.tm_sec, static_cast<int>(millis));
  if (written <= 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
    return "";
  }
  return std::string(buffer, static_cast<std::size_t>(written));
}

// Serial numbers read from sysfs and video node names may carry
// arbitrary bytes; anything below 0x20 is written as \xNN.
void AppendQuoted(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      line += "\\\\";
      break;
    case '"':
      line += "\\\"";
      break;
    case '\n':
      line += "\\n";
      break;
    case '\r':
      line += "\\r";
      break;
    case '\t':
      line += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U) {
        char hex[5];
        std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned char>(c));
        line += hex;
      } else {
        line.push_back(c);
      }
      break;
    }
  }
  line.push_back('"');
}

} // namespace

const char* ToString(LogLevel level) {
  for (const LevelName& entry : kLevels) {
    if (entry.level == level) {
      return entry.upper;
    }
  }
  return "INFO";
}

std::string ExpectedLogLevelList() {
  std::string list;
  for (const LevelName& entry : kLevels) {
    if (!list.empty()) {
      list.push_back('|');
    }
    list += entry.lower;
  }
  return list;
}

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }
  if (EqualsIgnoreCase(raw, "warning")) {
    level = LogLevel::kWarn;
    return true;
  }
  for (const LevelName& entry : kLevels) {
    if (EqualsIgnoreCase(raw, entry.lower)) {
      level = entry.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

void Logger::Log(LogLevel level, std::string_view message,
                 std::initializer_list<LogFieldView> fields) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }

  std::string line = "ts_utc=" + UtcTimestampNow();
  line += " level=";
  line += ToString(level);
  line += " component=\"camlight\" msg=";
  AppendQuoted(line, message);
  for (const LogFieldView& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    AppendQuoted(line, field.value);
  }
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(mu_);
  out_->write(line.data(), static_cast<std::streamsize>(line.size()));
  out_->flush();
}

} // namespace camlight::core::logging
