#include "signals/open_count_tracker.hpp"

namespace camlight::signals {

void OpenCountTracker::OnOpen() {
  ++open_count_;
}

void OpenCountTracker::OnClose() {
  if (open_count_ > 0U) {
    --open_count_;
  }
}

std::optional<bool> OpenCountTracker::TakeEdge() {
  const bool active = open_count_ > 0U;
  if (active == reported_active_) {
    return std::nullopt;
  }
  reported_active_ = active;
  return active;
}

} // namespace camlight::signals
