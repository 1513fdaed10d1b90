#include "devices/linux/hidraw_light_context.hpp"

#include "devices/litra_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace camlight::devices {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

std::string TrimLine(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }
  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

bool ParseHex16(std::string_view text, std::uint16_t& value) {
  if (text.empty()) {
    return false;
  }
  std::uint32_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed, 16);
  if (ec != std::errc() || ptr != end || parsed > 0xFFFFU) {
    return false;
  }
  value = static_cast<std::uint16_t>(parsed);
  return true;
}

std::optional<std::size_t> ParseHidrawIndex(std::string_view name) {
  if (!StartsWith(name, "hidraw")) {
    return std::nullopt;
  }
  const std::string_view suffix = name.substr(6);
  if (suffix.empty()) {
    return std::nullopt;
  }
  std::size_t parsed = 0;
  const char* begin = suffix.data();
  const char* end = begin + suffix.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

std::string ErrnoText(const int err) {
  return std::string(std::strerror(err));
}

class HidrawLightHandle final : public ILightHandle {
public:
  HidrawLightHandle(DeviceInfo info, std::string serial, int fd,
                    const HidrawLightContext::IoOps& ops)
      : info_(std::move(info)), serial_(std::move(serial)), fd_(fd), ops_(ops) {}

  ~HidrawLightHandle() override {
    if (fd_ >= 0) {
      ops_.close_fn(fd_);
    }
  }

  HidrawLightHandle(const HidrawLightHandle&) = delete;
  HidrawLightHandle& operator=(const HidrawLightHandle&) = delete;

  DeviceType Type() const override {
    return info_.type;
  }

  const std::string& Path() const override {
    return info_.path;
  }

  std::uint16_t ProductId() const override {
    return info_.product_id;
  }

  bool SerialNumber(std::string& serial, std::string& error) const override {
    error.clear();
    serial = serial_;
    return true;
  }

  bool SetPower(const bool on, std::string& error) override {
    return WriteReport(litra::BuildPowerReport(info_.type, on), error);
  }

  bool SetAuxiliaryPower(const bool on, std::string& error) override {
    litra::Report report{};
    if (!litra::BuildAuxiliaryPowerReport(info_.type, on, report, error)) {
      return false;
    }
    return WriteReport(report, error);
  }

private:
  bool WriteReport(const litra::Report& report, std::string& error) {
    ssize_t written = 0;
    do {
      written = ops_.write_fn(fd_, report.data(), report.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
      error = "failed to write HID report to " + info_.path + ": " + ErrnoText(errno);
      return false;
    }
    if (static_cast<std::size_t>(written) != report.size()) {
      error = "short HID report write to " + info_.path + " (" + std::to_string(written) + " of " +
              std::to_string(report.size()) + " bytes)";
      return false;
    }
    return true;
  }

  DeviceInfo info_;
  std::string serial_;
  int fd_ = -1;
  HidrawLightContext::IoOps ops_;
};

} // namespace

bool ParseHidrawUevent(const std::string& text, HidrawUevent& uevent, std::string& error) {
  uevent = HidrawUevent{};
  error.clear();

  bool have_id = false;
  std::istringstream input(text);
  std::string line;
  while (std::getline(input, line)) {
    const std::string trimmed = TrimLine(line);
    if (StartsWith(trimmed, "HID_ID=")) {
      // HID_ID=<bus>:<vendor>:<product>, each hex and zero padded to 4 or 8.
      const std::string_view value = std::string_view(trimmed).substr(7);
      const std::size_t first = value.find(':');
      const std::size_t second =
          first == std::string_view::npos ? std::string_view::npos : value.find(':', first + 1);
      if (second == std::string_view::npos) {
        error = "malformed HID_ID line: " + trimmed;
        return false;
      }
      std::string_view vendor = value.substr(first + 1, second - first - 1);
      std::string_view product = value.substr(second + 1);
      // Values are 8 hex digits wide; only the low 16 bits are meaningful.
      if (vendor.size() > 4U) {
        vendor = vendor.substr(vendor.size() - 4U);
      }
      if (product.size() > 4U) {
        product = product.substr(product.size() - 4U);
      }
      if (!ParseHex16(vendor, uevent.vendor_id) || !ParseHex16(product, uevent.product_id)) {
        error = "malformed HID_ID line: " + trimmed;
        return false;
      }
      have_id = true;
      continue;
    }
    if (StartsWith(trimmed, "HID_UNIQ=")) {
      uevent.uniq = trimmed.substr(9);
    }
  }

  if (!have_id) {
    error = "uevent is missing HID_ID";
    return false;
  }
  return true;
}

HidrawLightContext::HidrawLightContext() : HidrawLightContext(Paths{}, DefaultIoOps()) {}

HidrawLightContext::HidrawLightContext(Paths paths, IoOps ops)
    : paths_(std::move(paths)), ops_(std::move(ops)) {
  const IoOps defaults = DefaultIoOps();
  if (!ops_.open_fn) {
    ops_.open_fn = defaults.open_fn;
  }
  if (!ops_.close_fn) {
    ops_.close_fn = defaults.close_fn;
  }
  if (!ops_.write_fn) {
    ops_.write_fn = defaults.write_fn;
  }
}

HidrawLightContext::IoOps HidrawLightContext::DefaultIoOps() {
  IoOps ops;
  ops.open_fn = [](const char* path, const int flags) { return ::open(path, flags); };
  ops.close_fn = [](const int fd) { return ::close(fd); };
  ops.write_fn = [](const int fd, const void* data, const std::size_t size) {
    return ::write(fd, data, size);
  };
  return ops;
}

bool HidrawLightContext::Refresh(std::string& error) {
  error.clear();

  std::error_code ec;
  if (!fs::is_directory(paths_.sysfs_class_dir, ec) || ec) {
    error = "hidraw class directory is not available: " + paths_.sysfs_class_dir.string();
    return false;
  }

  // Non-throwing iteration: Refresh runs on the coordinator worker and every
  // scan failure is an enumeration error.
  std::vector<std::pair<std::size_t, Node>> discovered;
  fs::directory_iterator it(paths_.sysfs_class_dir, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    const std::string name = entry.path().filename().string();
    const std::optional<std::size_t> index = ParseHidrawIndex(name);
    if (!index.has_value()) {
      continue;
    }

    std::ifstream uevent_file(entry.path() / "device" / "uevent", std::ios::binary);
    if (!uevent_file) {
      // Nodes can disappear between listing and reading; skip them.
      continue;
    }
    const std::string text((std::istreambuf_iterator<char>(uevent_file)),
                           std::istreambuf_iterator<char>());

    HidrawUevent uevent;
    std::string parse_error;
    if (!ParseHidrawUevent(text, uevent, parse_error)) {
      continue;
    }

    const std::optional<DeviceType> type =
        litra::DeviceTypeForProduct(uevent.vendor_id, uevent.product_id);
    if (!type.has_value()) {
      continue;
    }

    Node node;
    node.info.type = type.value();
    node.info.path = (paths_.dev_dir / name).string();
    node.info.product_id = uevent.product_id;
    node.serial = uevent.uniq;
    discovered.emplace_back(index.value(), std::move(node));
  }
  if (ec) {
    error = "failed to iterate " + paths_.sysfs_class_dir.string() + ": " + ec.message();
    return false;
  }

  std::sort(discovered.begin(), discovered.end(),
            [](const auto& left, const auto& right) { return left.first < right.first; });

  nodes_.clear();
  nodes_.reserve(discovered.size());
  for (auto& [index, node] : discovered) {
    nodes_.push_back(std::move(node));
  }
  return true;
}

std::vector<DeviceInfo> HidrawLightContext::ConnectedDevices() const {
  std::vector<DeviceInfo> devices;
  devices.reserve(nodes_.size());
  for (const Node& node : nodes_) {
    devices.push_back(node.info);
  }
  return devices;
}

bool HidrawLightContext::Open(const DeviceInfo& device, std::unique_ptr<ILightHandle>& handle,
                              std::string& error) {
  handle.reset();
  error.clear();

  const auto it = std::find_if(nodes_.begin(), nodes_.end(),
                               [&](const Node& node) { return node.info.path == device.path; });
  if (it == nodes_.end()) {
    error = "device is no longer connected: " + device.path;
    return false;
  }

  const int fd = ops_.open_fn(device.path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    error = "failed to open " + device.path + ": " + ErrnoText(errno);
    return false;
  }

  handle = std::make_unique<HidrawLightHandle>(it->info, it->serial, fd, ops_);
  return true;
}

} // namespace camlight::devices
