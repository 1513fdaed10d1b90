#include "devices/device_model.hpp"

#include <cstddef>

namespace camlight::devices {

namespace {

using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::SetError;

std::string JoinSerials(const std::vector<std::string>& serials) {
  std::string joined;
  for (std::size_t i = 0; i < serials.size(); ++i) {
    if (i > 0U) {
      joined += ",";
    }
    joined += serials[i];
  }
  return joined;
}

} // namespace

const char* ToString(const DeviceType type) {
  switch (type) {
  case DeviceType::kGlow:
    return "glow";
  case DeviceType::kBeam:
    return "beam";
  case DeviceType::kBeamLx:
    return "beam_lx";
  }
  return "glow";
}

const char* DisplayName(const DeviceType type) {
  switch (type) {
  case DeviceType::kGlow:
    return "Litra Glow";
  case DeviceType::kBeam:
    return "Litra Beam";
  case DeviceType::kBeamLx:
    return "Litra Beam LX";
  }
  return "Litra Glow";
}

bool ParseDeviceType(std::string_view raw, DeviceType& type, Error& error) {
  if (raw == "glow") {
    type = DeviceType::kGlow;
    return true;
  }
  if (raw == "beam") {
    type = DeviceType::kBeam;
    return true;
  }
  if (raw == "beam_lx") {
    type = DeviceType::kBeamLx;
    return true;
  }

  SetError(error, ErrorCode::kInvalidDeviceType,
           "Invalid device type '" + std::string(raw) + "'. Must be one of: glow, beam, beam_lx");
  return false;
}

bool HasSerialFilter(const DeviceFilter& filter) {
  return !filter.serial_numbers.empty();
}

bool ValidateDeviceFilter(const DeviceFilter& filter, Error& error) {
  int kinds = 0;
  if (HasSerialFilter(filter)) {
    ++kinds;
  }
  if (filter.device_path.has_value()) {
    ++kinds;
  }
  if (filter.device_type.has_value()) {
    ++kinds;
  }

  if (kinds > 1) {
    SetError(error, ErrorCode::kMultipleFiltersSpecified,
             "Only one filter (--serial-number, --device-path, or --device-type) can be "
             "specified at a time.");
    return false;
  }
  return true;
}

bool SupportsAuxiliaryLight(const DeviceType type) {
  return type == DeviceType::kBeamLx;
}

std::string DescribeFilter(const DeviceFilter& filter) {
  if (filter.device_path.has_value()) {
    return "device_path:" + filter.device_path.value();
  }
  if (filter.device_type.has_value()) {
    return std::string("device_type:") + ToString(filter.device_type.value());
  }
  if (HasSerialFilter(filter)) {
    return "serial_number:" + JoinSerials(filter.serial_numbers);
  }
  return "all";
}

} // namespace camlight::devices
