#include "signals/signal_source_factory.hpp"

#include "signals/linux/inotify_camera_source.hpp"

namespace camlight::signals {

bool CreatePlatformSignalSource(const SignalSourceOptions& options, core::logging::Logger& logger,
                                std::unique_ptr<ICameraSignalSource>& source, std::string& error) {
  source.reset();
  error.clear();

  source = std::make_unique<InotifyCameraSource>(ResolveWatchTarget(options.video_device), logger);
  if (options.video_device.has_value()) {
    logger.Debug("Watching a single video device",
                 {{"video_device", options.video_device.value()}});
  }
  return true;
}

} // namespace camlight::signals
