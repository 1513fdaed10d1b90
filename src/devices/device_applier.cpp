#include "devices/device_applier.hpp"

#include "core/errors/error.hpp"

#include <string>

namespace camlight::devices {

ApplySummary ApplyPower(const LightHandles& handles, const bool power_on, const bool auxiliary,
                        const DeviceFilter& filter, core::logging::Logger& logger) {
  ApplySummary summary;
  if (handles.empty()) {
    LogDeviceNotFound(filter, logger);
    return summary;
  }

  const std::string_view verb = power_on ? "on" : "off";
  const std::string_view apply_error_code =
      core::errors::ToStableErrorCode(core::errors::ErrorCode::kPerDeviceApply);

  for (const auto& handle : handles) {
    if (handle == nullptr) {
      continue;
    }
    const std::string serial = SerialWithFallback(*handle);
    const std::string type = DisplayName(handle->Type());

    logger.Info(power_on ? "Turning on device" : "Turning off device",
                {{"device_type", type}, {"serial_number", serial}, {"path", handle->Path()}});

    ++summary.attempted;
    std::string error;
    if (!handle->SetPower(power_on, error)) {
      ++summary.power_failures;
      logger.Warn("Failed to set device power",
                  {{"code", apply_error_code},
                   {"state", verb},
                   {"device_type", type},
                   {"serial_number", serial},
                   {"error", error}});
    }

    if (!auxiliary || !SupportsAuxiliaryLight(handle->Type())) {
      continue;
    }

    ++summary.auxiliary_attempted;
    error.clear();
    if (!handle->SetAuxiliaryPower(power_on, error)) {
      ++summary.auxiliary_failures;
      logger.Warn("Failed to set device back light",
                  {{"code", apply_error_code},
                   {"state", verb},
                   {"device_type", type},
                   {"serial_number", serial},
                   {"error", error}});
    }
  }

  return summary;
}

} // namespace camlight::devices
