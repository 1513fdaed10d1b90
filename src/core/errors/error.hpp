#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace camlight::core::errors {

// Stable classification for every failure the session can observe.
//
// Only context-level and adapter-level codes ever end a session; per-device
// failures are absorbed where they happen and only show up in logs.
enum class ErrorCode {
  kNone = 0,
  kEnumeration,
  kNoDevicesFound,
  kDeviceNotFound,
  kPerDeviceApply,
  kAdapter,
  kMultipleFiltersSpecified,
  kInvalidDeviceType,
  kConfigFile,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const {
    return code == ErrorCode::kNone;
  }
};

std::string_view ToStableErrorCode(ErrorCode code);

// Returns single-line text: "<STABLE_CODE>: <message>".
std::string FormatError(const Error& error);

// Maps a fatal error onto the process exit contract.
ExitCode ExitCodeFor(ErrorCode code);

inline void SetError(Error& error, ErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
}

inline void ClearError(Error& error) {
  error.code = ErrorCode::kNone;
  error.message.clear();
}

} // namespace camlight::core::errors
