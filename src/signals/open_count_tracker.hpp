#pragma once

#include <cstddef>
#include <optional>

namespace camlight::signals {

// Coalesces raw device open/close events into net "camera in use" edges.
//
// Raw feeds report every open of every video node, including re-opens of an
// already-active camera. Only the transitions 0 -> 1+ and 1+ -> 0 are
// forwarded. Closes never take the count below zero, so closes for opens
// that happened before watching started are ignored.
class OpenCountTracker {
public:
  void OnOpen();
  void OnClose();

  // Returns the edge produced since the previous call, if the in-use state
  // differs from the last reported one. Events folded within one batch that
  // return to the starting state produce no edge.
  std::optional<bool> TakeEdge();

  std::size_t open_count() const {
    return open_count_;
  }

private:
  std::size_t open_count_ = 0U;
  bool reported_active_ = false;
};

} // namespace camlight::signals
