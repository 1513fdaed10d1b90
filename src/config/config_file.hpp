#ifndef CAMLIGHT_CONFIG_CONFIG_FILE_HPP_
#define CAMLIGHT_CONFIG_CONFIG_FILE_HPP_

#include "core/errors/error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlight::config {

// Values read from a configuration file. Absent keys stay nullopt so the
// command line can tell "not configured" from "configured as default".
struct ConfigFile {
  std::optional<std::vector<std::string>> serial_numbers;
  std::optional<std::string> device_path;
  std::optional<std::string> device_type;
  std::optional<bool> require_device;
  std::optional<std::string> video_device;
  std::optional<std::uint64_t> delay_ms;
  std::optional<bool> verbose;
  std::optional<bool> back;
};

// Keys accepted in configuration files, in documentation order.
const std::vector<std::string_view>& KnownConfigKeys();

// Parses the flat YAML subset used for configuration:
//   # comment
//   key: value            (plain, "double" or 'single' quoted scalar)
//   serial_number: [a, b] (flow list, serial_number only)
//   key:                  (null => same as absent)
//
// Nested mappings, block lists and anchors are rejected. Unknown or
// duplicate keys fail. Syntax/type problems are reported as
// `kConfigFile` with a "Failed to parse YAML" prefix and the line number.
// After parsing, `device_type` and filter exclusivity are validated.
bool ParseConfigText(std::string_view text, ConfigFile& config, core::errors::Error& error);

// Reads and parses a configuration file. Read failures are `kConfigFile`
// with a "Failed to read config file" prefix.
bool LoadConfigFile(const std::filesystem::path& path, ConfigFile& config,
                    core::errors::Error& error);

} // namespace camlight::config

#endif // CAMLIGHT_CONFIG_CONFIG_FILE_HPP_
