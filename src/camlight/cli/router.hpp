#pragma once

#include "camlight/cli/options.hpp"
#include "core/logging/logger.hpp"
#include "devices/light_device.hpp"
#include "signals/camera_signal_source.hpp"

#include <ostream>
#include <string_view>

namespace camlight::cli {

std::string_view VersionString();

// One usage text source for `--help` and usage errors.
void PrintUsage(std::ostream& out);

// Runs one watch session against already-built dependencies and maps the
// outcome onto the process exit contract. Exposed so tests can drive the
// full path with fake lights and a scripted source.
int ExecuteWatch(const ResolvedOptions& options, devices::ILightContext& context,
                 signals::ICameraSignalSource& source, core::logging::Logger& logger);

// Parses the command line, merges the config file, builds the platform light
// context and camera source, and runs until SIGINT/SIGTERM or a fatal error.
//
// Exit codes:
//   0  => stopped by signal (or --help / --version)
//   2  => usage error (unknown flag / missing value)
//   10 => invalid configuration (config file, device type, filters)
//   20 => required light not found
//   30 => camera source failed
//   40 => light enumeration failed
//   1  => any other failure
int Dispatch(int argc, char** argv);

} // namespace camlight::cli
