#pragma once

#include "devices/light_device.hpp"

#include <memory>
#include <string>

namespace camlight::devices {

// Creates the hidraw-backed light context.
bool CreatePlatformLightContext(std::unique_ptr<ILightContext>& context, std::string& error);

} // namespace camlight::devices
