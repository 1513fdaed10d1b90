#pragma once

#include "signals/camera_signal_source.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camlight::signals::testing {

// One scripted step: wait `delay_before`, then deliver `camera_active`.
struct ScriptedEdge {
  std::chrono::milliseconds delay_before{0};
  bool camera_active = false;
};

// Deterministic stand-in for a platform feed.
//
// After the script is exhausted the source either blocks until `Stop`
// (default) or fails with `failure_after_script` to simulate an adapter
// dying.
class ScriptedSignalSource final : public ICameraSignalSource {
public:
  explicit ScriptedSignalSource(std::vector<ScriptedEdge> script,
                                std::optional<std::string> failure_after_script = std::nullopt);

  bool Run(const EdgeSink& sink, std::string& error) override;
  void Stop() override;
  std::string Describe() const override;

  std::size_t delivered() const;
  bool script_finished() const;

private:
  // Sleeps up to `delay`; returns false when stopped meanwhile.
  bool WaitOrStop(std::chrono::milliseconds delay);

  std::vector<ScriptedEdge> script_;
  std::optional<std::string> failure_after_script_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool script_finished_ = false;
  std::size_t delivered_ = 0U;
};

} // namespace camlight::signals::testing
