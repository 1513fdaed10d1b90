#pragma once

namespace camlight::core::errors {

// Stable process-exit contract for service managers and wrapper scripts.
//
// The first three values keep their conventional meanings:
// - 0 success (clean shutdown on SIGINT/SIGTERM)
// - 1 generic failure
// - 2 usage/argument failure
//
// The remaining values classify the fatal conditions a long-running session
// can end with, so a supervisor can decide whether a restart makes sense.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDeviceNotFound = 20,
  kSignalSourceFailed = 30,
  kEnumerationFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camlight::core::errors
