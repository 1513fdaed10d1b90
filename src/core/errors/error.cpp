#include "core/errors/error.hpp"

namespace camlight::core::errors {

std::string_view ToStableErrorCode(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return "OK";
  case ErrorCode::kEnumeration:
    return "ENUMERATION_ERROR";
  case ErrorCode::kNoDevicesFound:
    return "NO_DEVICES_FOUND";
  case ErrorCode::kDeviceNotFound:
    return "DEVICE_NOT_FOUND";
  case ErrorCode::kPerDeviceApply:
    return "PER_DEVICE_APPLY_ERROR";
  case ErrorCode::kAdapter:
    return "ADAPTER_ERROR";
  case ErrorCode::kMultipleFiltersSpecified:
    return "MULTIPLE_FILTERS_SPECIFIED";
  case ErrorCode::kInvalidDeviceType:
    return "INVALID_DEVICE_TYPE";
  case ErrorCode::kConfigFile:
    return "CONFIG_FILE_ERROR";
  }
  return "UNKNOWN";
}

std::string FormatError(const Error& error) {
  std::string text(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

ExitCode ExitCodeFor(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return ExitCode::kSuccess;
  case ErrorCode::kNoDevicesFound:
  case ErrorCode::kDeviceNotFound:
    return ExitCode::kDeviceNotFound;
  case ErrorCode::kAdapter:
    return ExitCode::kSignalSourceFailed;
  case ErrorCode::kEnumeration:
    return ExitCode::kEnumerationFailed;
  case ErrorCode::kMultipleFiltersSpecified:
  case ErrorCode::kInvalidDeviceType:
  case ErrorCode::kConfigFile:
    return ExitCode::kConfigInvalid;
  case ErrorCode::kPerDeviceApply:
    return ExitCode::kFailure;
  }
  return ExitCode::kFailure;
}

} // namespace camlight::core::errors
