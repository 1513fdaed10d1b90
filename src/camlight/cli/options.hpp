#pragma once

#include "config/config_file.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "session/session_driver.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camlight::cli {

inline constexpr std::uint64_t kDefaultDelayMs = 1500;

// Raw command line, before any config file is merged in.
struct CliOptions {
  std::optional<std::string> config_file;
  std::vector<std::string> serial_numbers;
  std::optional<std::string> device_path;
  std::optional<std::string> device_type;
  bool require_device = false;
  std::optional<std::string> video_device;
  std::uint64_t delay_ms = kDefaultDelayMs;
  bool back = false;
  bool verbose = false;
  std::optional<core::logging::LogLevel> log_level;
  bool show_help = false;
  bool show_version = false;
};

// Everything `Dispatch` needs to start a watch session.
struct ResolvedOptions {
  session::SessionOptions session;
  std::optional<std::string> video_device;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses arguments (without argv[0]). Accepts `--flag value`,
// `--flag=value` and the short aliases. Unknown options, missing values,
// positional arguments and malformed delays are usage errors.
bool ParseCliArgs(const std::vector<std::string_view>& args, CliOptions& options,
                  std::string& error);

// Merges an optional config file into the command line and validates the
// result:
// - CLI values win over config values
// - the config delay only applies while the CLI delay is the default
// - boolean flags OR together
// - `--log-level` wins; otherwise verbose selects debug
// Device type and filter exclusivity failures keep their error codes.
bool ResolveOptions(const CliOptions& cli, const std::optional<config::ConfigFile>& file,
                    ResolvedOptions& resolved, core::errors::Error& error);

} // namespace camlight::cli
