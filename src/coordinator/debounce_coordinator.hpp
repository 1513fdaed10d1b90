#pragma once

#include "coordinator/shared_device_context.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "devices/device_model.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace camlight::coordinator {

constexpr std::chrono::milliseconds kDefaultSettleDelay{1500};

struct CoordinatorOptions {
  devices::DeviceFilter filter;
  std::chrono::milliseconds settle_delay = kDefaultSettleDelay;
  bool require_device = false;
  bool apply_auxiliary = false;
};

enum class CoordinatorState {
  kIdle = 0,
  kSettling,
  kStopped,
};

const char* ToString(CoordinatorState state);

struct CoordinatorStats {
  std::uint64_t edges_received = 0U;
  std::uint64_t actions_scheduled = 0U;
  std::uint64_t actions_canceled = 0U;
  // Expired actions that found no intent to apply.
  std::uint64_t empty_expirations = 0U;
  std::uint64_t applies_executed = 0U;
};

// Called once, from the worker thread, when an apply pass ends in a fatal
// error. The coordinator is already stopped when this runs.
using FatalHandler = std::function<void(const core::errors::Error&)>;

// Collapses bursty camera edges into one settled power intent and applies
// it to the matched lights once per settle.
//
// Model:
// - `intent_` is the last requested power state (nullopt = unknown/consumed)
// - `pending_` is an owned slot holding at most one scheduled action;
//   scheduling always cancels the previous occupant first
// - one worker thread sleeps until the slot's deadline; when it expires the
//   slot is consumed and the intent is read-and-cleared in the same critical
//   section, so a cancel and an expiry can never both take effect
// - the apply pass itself runs outside `mu_` and under the shared device
//   context lock, so edges keep arriving while lights are being driven
//
// Invariants:
// - at most one apply runs at a time (single worker)
// - an apply uses the latest intent as of its expiry
// - a canceled action performs no device access
// - the same intent twice in a row simply applies twice
class DebounceCoordinator {
public:
  DebounceCoordinator(CoordinatorOptions options, SharedDeviceContext& devices,
                      core::logging::Logger& logger, FatalHandler on_fatal = {});
  ~DebounceCoordinator();

  DebounceCoordinator(const DebounceCoordinator&) = delete;
  DebounceCoordinator& operator=(const DebounceCoordinator&) = delete;

  // Ingests one edge: records the intent, cancels any pending action and
  // schedules a new one `settle_delay` from now. Ignored once stopped.
  void OnEdge(bool camera_active);

  // Cancels any pending action, waits for a running apply and joins the
  // worker. Idempotent.
  void Shutdown();

  CoordinatorState state() const;
  CoordinatorStats stats() const;
  std::optional<core::errors::Error> fatal_error() const;

  // Blocks until no action is pending and no apply is running, or until
  // `timeout`. Returns true when idle.
  bool WaitForIdle(std::chrono::milliseconds timeout) const;

private:
  struct PendingAction {
    std::uint64_t generation = 0U;
    std::chrono::steady_clock::time_point deadline{};
  };

  void WorkerLoop();
  bool ApplyIntent(bool power_on, core::errors::Error& error);

  const CoordinatorOptions options_;
  SharedDeviceContext& devices_;
  core::logging::Logger& logger_;
  FatalHandler on_fatal_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::optional<bool> intent_;
  std::optional<PendingAction> pending_;
  std::uint64_t next_generation_ = 1U;
  bool applying_ = false;
  bool stopped_ = false;
  std::optional<core::errors::Error> fatal_;
  CoordinatorStats stats_;

  std::thread worker_;
};

} // namespace camlight::coordinator
