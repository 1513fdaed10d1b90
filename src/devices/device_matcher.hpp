#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "devices/device_model.hpp"
#include "devices/light_device.hpp"

#include <memory>
#include <vector>

namespace camlight::devices {

using LightHandles = std::vector<std::unique_ptr<ILightHandle>>;

// Selects and opens the lights targeted by `filter`.
//
// Rules, in order:
// 1) filter must pass `ValidateDeviceFilter`
// 2) context is refreshed; refresh failure => `kEnumeration`
// 3) device_path set => exact path match, other criteria ignored;
//    else device_type set => exact type match; else every device
// 4) candidates are opened; open failures drop the device silently
// 5) serial_numbers non-empty => keep handles whose readable serial is listed
// 6) nothing left and `require_device` => `kDeviceNotFound` when serials were
//    requested, otherwise `kNoDevicesFound`
//
// `handles` is always cleared first and stays empty (never null) when
// nothing matches without `require_device`.
bool MatchDevices(ILightContext& context, const DeviceFilter& filter, bool require_device,
                  LightHandles& handles, core::errors::Error& error);

// Emits the "not found" observation for an empty match.
void LogDeviceNotFound(const DeviceFilter& filter, core::logging::Logger& logger);

} // namespace camlight::devices
