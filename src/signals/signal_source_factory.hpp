#pragma once

#include "core/logging/logger.hpp"
#include "signals/camera_signal_source.hpp"

#include <memory>
#include <optional>
#include <string>

namespace camlight::signals {

struct SignalSourceOptions {
  // Watch a single video node instead of every `/dev/video*`.
  std::optional<std::string> video_device;
};

// Creates the inotify feed on the configured video nodes.
bool CreatePlatformSignalSource(const SignalSourceOptions& options, core::logging::Logger& logger,
                                std::unique_ptr<ICameraSignalSource>& source, std::string& error);

} // namespace camlight::signals
