#include "devices/light_context_factory.hpp"

#include "devices/linux/hidraw_light_context.hpp"

namespace camlight::devices {

bool CreatePlatformLightContext(std::unique_ptr<ILightContext>& context, std::string& error) {
  context.reset();
  error.clear();

  context = std::make_unique<HidrawLightContext>();
  return true;
}

} // namespace camlight::devices
