#pragma once

#include "core/logging/logger.hpp"
#include "signals/camera_signal_source.hpp"
#include "signals/open_count_tracker.hpp"
#include "signals/stop_pipe.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace camlight::signals {

// Which directory to watch and which entries in it count as cameras.
struct InotifyWatchTarget {
  std::filesystem::path watch_dir = "/dev";
  // Exact node name when a single video device was requested.
  std::optional<std::string> exact_name;
  // Prefix used when no single device was requested.
  std::string name_prefix = "video";
};

// Builds the watch target for an optional `--video-device` path: the parent
// directory is watched and only that node's events count.
InotifyWatchTarget ResolveWatchTarget(const std::optional<std::string>& video_device);

bool MatchesWatchTarget(const InotifyWatchTarget& target, std::string_view name);

// Linux camera feed: counts OPEN and CLOSE events on video nodes via inotify
// and forwards net in-use transitions.
class InotifyCameraSource final : public ICameraSignalSource {
public:
  InotifyCameraSource(InotifyWatchTarget target, core::logging::Logger& logger);

  bool Run(const EdgeSink& sink, std::string& error) override;
  void Stop() override;
  std::string Describe() const override;

private:
  bool DrainEvents(int inotify_fd, const EdgeSink& sink, std::string& error);

  InotifyWatchTarget target_;
  core::logging::Logger& logger_;
  OpenCountTracker tracker_;
  StopPipe stop_pipe_;
  std::string init_error_;
  std::atomic<bool> stop_requested_{false};
};

} // namespace camlight::signals
