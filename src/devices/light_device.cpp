#include "devices/light_device.hpp"

#include <iomanip>
#include <sstream>

namespace camlight::devices {

std::string SerialWithFallback(const ILightHandle& handle) {
  std::string serial;
  std::string error;
  if (handle.SerialNumber(serial, error) && !serial.empty()) {
    return serial;
  }

  std::ostringstream out;
  out << ToString(handle.Type()) << '-' << std::hex << std::setw(4) << std::setfill('0')
      << handle.ProductId() << '-' << handle.Path();
  return out.str();
}

} // namespace camlight::devices
