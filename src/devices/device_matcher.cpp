#include "devices/device_matcher.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace camlight::devices {

namespace {

using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::SetError;

bool MatchesCandidateFilter(const DeviceInfo& device, const DeviceFilter& filter) {
  if (filter.device_path.has_value()) {
    return device.path == filter.device_path.value();
  }
  if (filter.device_type.has_value()) {
    return device.type == filter.device_type.value();
  }
  // Serial filtering needs an opened handle; see the second pass.
  return true;
}

bool MatchesSerialFilter(const ILightHandle& handle, const DeviceFilter& filter) {
  if (!HasSerialFilter(filter)) {
    return true;
  }

  std::string serial;
  std::string error;
  if (!handle.SerialNumber(serial, error) || serial.empty()) {
    return false;
  }
  return std::find(filter.serial_numbers.begin(), filter.serial_numbers.end(), serial) !=
         filter.serial_numbers.end();
}

std::string JoinSerialsForMessage(const std::vector<std::string>& serials) {
  std::string joined;
  for (std::size_t i = 0; i < serials.size(); ++i) {
    if (i > 0U) {
      joined += ", ";
    }
    joined += serials[i];
  }
  return joined;
}

std::string NotFoundMessage(const DeviceFilter& filter) {
  if (HasSerialFilter(filter)) {
    return "Litra device with serial number " + JoinSerialsForMessage(filter.serial_numbers) +
           " not found";
  }
  return "No Litra devices found";
}

} // namespace

bool MatchDevices(ILightContext& context, const DeviceFilter& filter, const bool require_device,
                  LightHandles& handles, Error& error) {
  handles.clear();
  core::errors::ClearError(error);

  if (!ValidateDeviceFilter(filter, error)) {
    return false;
  }

  std::string refresh_error;
  if (!context.Refresh(refresh_error)) {
    SetError(error, ErrorCode::kEnumeration, refresh_error);
    return false;
  }

  for (const DeviceInfo& device : context.ConnectedDevices()) {
    if (!MatchesCandidateFilter(device, filter)) {
      continue;
    }

    std::unique_ptr<ILightHandle> handle;
    std::string open_error;
    if (!context.Open(device, handle, open_error) || handle == nullptr) {
      continue;
    }
    if (!MatchesSerialFilter(*handle, filter)) {
      continue;
    }
    handles.push_back(std::move(handle));
  }

  if (handles.empty() && require_device) {
    SetError(error,
             HasSerialFilter(filter) ? ErrorCode::kDeviceNotFound : ErrorCode::kNoDevicesFound,
             NotFoundMessage(filter));
    return false;
  }
  return true;
}

void LogDeviceNotFound(const DeviceFilter& filter, core::logging::Logger& logger) {
  if (HasSerialFilter(filter)) {
    logger.Warn(NotFoundMessage(filter),
                {{"serial_number", JoinSerialsForMessage(filter.serial_numbers)}});
    return;
  }
  logger.Warn(NotFoundMessage(filter), {{"filter", DescribeFilter(filter)}});
}

} // namespace camlight::devices
