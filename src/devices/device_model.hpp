#pragma once

#include "core/errors/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlight::devices {

// Closed set of supported light product families.
enum class DeviceType {
  kGlow = 0,
  kBeam,
  kBeamLx,
};

// Identity of one connected light as reported by enumeration, before open.
struct DeviceInfo {
  DeviceType type = DeviceType::kGlow;
  std::string path;
  std::uint16_t product_id = 0;
};

// Selection criteria built once from merged configuration.
//
// Semantics:
// - `serial_numbers` empty => no serial restriction; several entries form
//   one filter kind and match when the device serial is any of them
// - `device_path` => exact path equality
// - `device_type` => exact product family equality
// - at most one kind may be set (see `ValidateDeviceFilter`)
struct DeviceFilter {
  std::vector<std::string> serial_numbers;
  std::optional<std::string> device_path;
  std::optional<DeviceType> device_type;
};

// Returns the CLI/config spelling: `glow`, `beam`, `beam_lx`.
const char* ToString(DeviceType type);

// Human label used in log lines, e.g. "Litra Beam LX".
const char* DisplayName(DeviceType type);

// Case-sensitive parse of the CLI/config spelling.
bool ParseDeviceType(std::string_view raw, DeviceType& type, core::errors::Error& error);

// Rejects filters that set more than one kind. Several serial numbers are a
// single kind and stay valid.
bool ValidateDeviceFilter(const DeviceFilter& filter, core::errors::Error& error);

bool HasSerialFilter(const DeviceFilter& filter);

// Only Beam LX carries the secondary (back) light channel.
bool SupportsAuxiliaryLight(DeviceType type);

// Compact one-line description of a filter for startup logs.
std::string DescribeFilter(const DeviceFilter& filter);

} // namespace camlight::devices
