#include "devices/litra_protocol.hpp"

namespace camlight::devices::litra {

namespace {

Report MakeReport(const std::uint8_t feature, const std::uint8_t function, const bool on) {
  Report report{};
  report[0] = 0x11;
  report[1] = 0xff;
  report[2] = feature;
  report[3] = function;
  report[4] = on ? 0x01 : 0x00;
  return report;
}

} // namespace

std::optional<DeviceType> DeviceTypeForProduct(const std::uint16_t vendor_id,
                                               const std::uint16_t product_id) {
  if (vendor_id != kVendorId) {
    return std::nullopt;
  }
  switch (product_id) {
  case kProductIdGlow:
    return DeviceType::kGlow;
  case kProductIdBeam:
  case kProductIdBeamAlt:
    return DeviceType::kBeam;
  case kProductIdBeamLx:
    return DeviceType::kBeamLx;
  default:
    return std::nullopt;
  }
}

Report BuildPowerReport(const DeviceType type, const bool on) {
  // Beam LX moved the power feature to index 0x06.
  if (type == DeviceType::kBeamLx) {
    return MakeReport(0x06, 0x1c, on);
  }
  return MakeReport(0x04, 0x1c, on);
}

bool BuildAuxiliaryPowerReport(const DeviceType type, const bool on, Report& report,
                               std::string& error) {
  if (!SupportsAuxiliaryLight(type)) {
    error = std::string(DisplayName(type)) + " has no back light";
    return false;
  }
  report = MakeReport(0x0a, 0x4b, on);
  return true;
}

} // namespace camlight::devices::litra
