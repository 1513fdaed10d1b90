#pragma once

#include <functional>
#include <string>

namespace camlight::signals {

// Receives one normalized "camera in use" edge: true when at least one
// camera became active, false when the last active camera stopped.
using EdgeSink = std::function<void(bool camera_active)>;

// Platform feed of camera activity.
//
// Contract:
// - `Run` blocks on the OS feed and calls `sink` from the calling thread,
//   in arrival order
// - `Run` returns true only after `Stop`; any other return is an adapter
//   failure described by `error`
// - `Stop` may be called from any thread (including a signal-driven one)
//   and more than once
// - set-up and tear-down of the OS subscription stay inside the source
class ICameraSignalSource {
public:
  virtual ~ICameraSignalSource() = default;

  virtual bool Run(const EdgeSink& sink, std::string& error) = 0;

  virtual void Stop() = 0;

  // Short label used in logs, e.g. "inotify:/dev".
  virtual std::string Describe() const = 0;
};

} // namespace camlight::signals
