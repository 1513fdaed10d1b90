#pragma once

#include "devices/light_device.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace camlight::devices {

// Identity parsed from `/sys/class/hidraw/<node>/device/uevent`.
struct HidrawUevent {
  std::uint16_t vendor_id = 0;
  std::uint16_t product_id = 0;
  std::string uniq;
};

// Parses `HID_ID=<bus>:<vendor>:<product>` and `HID_UNIQ=<serial>` lines.
// Returns false when `HID_ID` is missing or malformed.
bool ParseHidrawUevent(const std::string& text, HidrawUevent& uevent, std::string& error);

// Linux light context backed by hidraw nodes.
//
// Contract:
// - `Refresh` scans `<sysfs_class_dir>/hidraw*`, keeps Litra product ids and
//   orders nodes by index; a missing class directory is a hard error
// - device paths are `<dev_dir>/<node>`
// - handles write fixed-size HID output reports to the opened node
// - IO ops are injectable so tests can run against a fake sysfs tree
class HidrawLightContext final : public ILightContext {
public:
  struct Paths {
    std::filesystem::path dev_dir = "/dev";
    std::filesystem::path sysfs_class_dir = "/sys/class/hidraw";
  };

  struct IoOps {
    std::function<int(const char* path, int flags)> open_fn;
    std::function<int(int fd)> close_fn;
    std::function<ssize_t(int fd, const void* data, std::size_t size)> write_fn;
  };

  HidrawLightContext();
  HidrawLightContext(Paths paths, IoOps ops);

  bool Refresh(std::string& error) override;
  std::vector<DeviceInfo> ConnectedDevices() const override;
  bool Open(const DeviceInfo& device, std::unique_ptr<ILightHandle>& handle,
            std::string& error) override;

  static IoOps DefaultIoOps();

private:
  struct Node {
    DeviceInfo info;
    std::string serial;
  };

  Paths paths_;
  IoOps ops_;
  std::vector<Node> nodes_;
};

} // namespace camlight::devices
