#pragma once

#include "devices/device_model.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace camlight::devices::litra {

constexpr std::uint16_t kVendorId = 0x046d;

constexpr std::uint16_t kProductIdGlow = 0xc900;
constexpr std::uint16_t kProductIdBeam = 0xc901;
constexpr std::uint16_t kProductIdBeamAlt = 0xb901;
constexpr std::uint16_t kProductIdBeamLx = 0xc903;

constexpr std::size_t kReportSize = 20U;

using Report = std::array<std::uint8_t, kReportSize>;

// Maps a USB product id onto a product family. Unknown products are not
// lights this tool drives.
std::optional<DeviceType> DeviceTypeForProduct(std::uint16_t vendor_id, std::uint16_t product_id);

// HID output report toggling the primary light.
Report BuildPowerReport(DeviceType type, bool on);

// HID output report toggling the back light. Fails for product families
// without a back light.
bool BuildAuxiliaryPowerReport(DeviceType type, bool on, Report& report, std::string& error);

} // namespace camlight::devices::litra
