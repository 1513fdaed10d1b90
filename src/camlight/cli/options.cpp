#include "camlight/cli/options.hpp"

#include "devices/device_model.hpp"

#include <charconv>
#include <chrono>
#include <system_error>
#include <utility>

namespace camlight::cli {

namespace {

using core::errors::Error;

bool ParseDelay(std::string_view raw, std::uint64_t& delay_ms, std::string& error) {
  const char* begin = raw.data();
  const char* end = begin + raw.size();
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for --delay '" + std::string(raw) +
            "' (expected a non-negative integer of milliseconds)";
    return false;
  }
  delay_ms = parsed;
  return true;
}

// Splits `--name=value`. Short options never carry an inline value.
void SplitInlineValue(std::string_view token, std::string_view& name,
                      std::optional<std::string_view>& inline_value) {
  name = token;
  inline_value.reset();
  if (token.size() > 2 && token.substr(0, 2) == "--") {
    const std::size_t equals = token.find('=');
    if (equals != std::string_view::npos) {
      name = token.substr(0, equals);
      inline_value = token.substr(equals + 1);
    }
  }
}

} // namespace

bool ParseCliArgs(const std::vector<std::string_view>& args, CliOptions& options,
                  std::string& error) {
  error.clear();

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view name;
    std::optional<std::string_view> inline_value;
    SplitInlineValue(args[i], name, inline_value);

    const auto is_flag = [&](std::string_view long_name, std::string_view short_name) {
      return name == long_name || (!short_name.empty() && name == short_name);
    };

    // Flags without a value.
    const auto take_switch = [&](bool& target) {
      if (inline_value.has_value()) {
        error = std::string(name) + " does not take a value";
        return false;
      }
      target = true;
      return true;
    };

    std::string_view value;
    const auto take_value = [&]() {
      if (inline_value.has_value()) {
        value = inline_value.value();
        return true;
      }
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(name);
        return false;
      }
      value = args[++i];
      return true;
    };

    if (is_flag("--help", "-h")) {
      if (!take_switch(options.show_help)) {
        return false;
      }
      continue;
    }
    if (is_flag("--version", "-V")) {
      if (!take_switch(options.show_version)) {
        return false;
      }
      continue;
    }
    if (is_flag("--require-device", "-r")) {
      if (!take_switch(options.require_device)) {
        return false;
      }
      continue;
    }
    if (is_flag("--back", "-b")) {
      if (!take_switch(options.back)) {
        return false;
      }
      continue;
    }
    if (is_flag("--verbose", "-v")) {
      if (!take_switch(options.verbose)) {
        return false;
      }
      continue;
    }

    if (is_flag("--config-file", "-c")) {
      if (!take_value()) {
        return false;
      }
      options.config_file = std::string(value);
      continue;
    }
    if (is_flag("--serial-number", "-s")) {
      if (!take_value()) {
        return false;
      }
      options.serial_numbers.emplace_back(value);
      continue;
    }
    if (is_flag("--device-path", "-p")) {
      if (!take_value()) {
        return false;
      }
      options.device_path = std::string(value);
      continue;
    }
    if (is_flag("--device-type", "-y")) {
      if (!take_value()) {
        return false;
      }
      options.device_type = std::string(value);
      continue;
    }
    if (is_flag("--video-device", "-d")) {
      if (!take_value()) {
        return false;
      }
      options.video_device = std::string(value);
      continue;
    }
    if (is_flag("--delay", "-t")) {
      if (!take_value() || !ParseDelay(value, options.delay_ms, error)) {
        return false;
      }
      continue;
    }
    if (is_flag("--log-level", "")) {
      if (!take_value()) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!name.empty() && name.front() == '-') {
      error = "unknown option: " + std::string(name);
      return false;
    }
    error = "unexpected argument: " + std::string(name);
    return false;
  }

  return true;
}

bool ResolveOptions(const CliOptions& cli, const std::optional<config::ConfigFile>& file,
                    ResolvedOptions& resolved, Error& error) {
  core::errors::ClearError(error);
  resolved = ResolvedOptions{};

  std::vector<std::string> serial_numbers = cli.serial_numbers;
  std::optional<std::string> device_path = cli.device_path;
  std::optional<std::string> device_type = cli.device_type;
  std::optional<std::string> video_device = cli.video_device;
  bool require_device = cli.require_device;
  bool back = cli.back;
  bool verbose = cli.verbose;
  std::uint64_t delay_ms = cli.delay_ms;

  if (file.has_value()) {
    const config::ConfigFile& config = file.value();
    if (serial_numbers.empty() && config.serial_numbers.has_value()) {
      serial_numbers = config.serial_numbers.value();
    }
    if (!device_path.has_value()) {
      device_path = config.device_path;
    }
    if (!device_type.has_value()) {
      device_type = config.device_type;
    }
    if (!video_device.has_value()) {
      video_device = config.video_device;
    }
    require_device = require_device || config.require_device.value_or(false);
    back = back || config.back.value_or(false);
    verbose = verbose || config.verbose.value_or(false);
    if (delay_ms == kDefaultDelayMs && config.delay_ms.has_value()) {
      delay_ms = config.delay_ms.value();
    }
  }

  devices::DeviceFilter filter;
  filter.serial_numbers = std::move(serial_numbers);
  filter.device_path = std::move(device_path);
  if (device_type.has_value()) {
    devices::DeviceType parsed = devices::DeviceType::kGlow;
    if (!devices::ParseDeviceType(device_type.value(), parsed, error)) {
      return false;
    }
    filter.device_type = parsed;
  }
  if (!devices::ValidateDeviceFilter(filter, error)) {
    return false;
  }

  resolved.session.filter = std::move(filter);
  resolved.session.settle_delay = std::chrono::milliseconds(delay_ms);
  resolved.session.require_device = require_device;
  resolved.session.apply_auxiliary = back;
  resolved.video_device = std::move(video_device);
  if (cli.log_level.has_value()) {
    resolved.log_level = cli.log_level.value();
  } else {
    resolved.log_level =
        verbose ? core::logging::LogLevel::kDebug : core::logging::LogLevel::kInfo;
  }
  return true;
}

} // namespace camlight::cli
