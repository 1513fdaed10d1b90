#include "coordinator/debounce_coordinator.hpp"

#include "devices/device_applier.hpp"
#include "devices/device_matcher.hpp"

#include <string>
#include <utility>

namespace camlight::coordinator {

const char* ToString(const CoordinatorState state) {
  switch (state) {
  case CoordinatorState::kIdle:
    return "idle";
  case CoordinatorState::kSettling:
    return "settling";
  case CoordinatorState::kStopped:
    return "stopped";
  }
  return "idle";
}

DebounceCoordinator::DebounceCoordinator(CoordinatorOptions options, SharedDeviceContext& devices,
                                         core::logging::Logger& logger, FatalHandler on_fatal)
    : options_(std::move(options)),
      devices_(devices),
      logger_(logger),
      on_fatal_(std::move(on_fatal)) {
  worker_ = std::thread([this] { WorkerLoop(); });
}

DebounceCoordinator::~DebounceCoordinator() {
  Shutdown();
}

void DebounceCoordinator::OnEdge(const bool camera_active) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopped_) {
      return;
    }
    ++stats_.edges_received;
    intent_ = camera_active;

    if (pending_.has_value()) {
      ++stats_.actions_canceled;
      pending_.reset();
    }
    pending_ = PendingAction{
        .generation = next_generation_++,
        .deadline = std::chrono::steady_clock::now() + options_.settle_delay,
    };
    ++stats_.actions_scheduled;
  }
  cv_.notify_all();

  logger_.Debug("Scheduled light update",
                {{"camera_active", camera_active ? "true" : "false"},
                 {"delay_ms", std::to_string(options_.settle_delay.count())}});
}

void DebounceCoordinator::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!stopped_) {
      stopped_ = true;
      if (pending_.has_value()) {
        ++stats_.actions_canceled;
        pending_.reset();
      }
    }
  }
  cv_.notify_all();

  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

CoordinatorState DebounceCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (stopped_) {
    return CoordinatorState::kStopped;
  }
  return pending_.has_value() ? CoordinatorState::kSettling : CoordinatorState::kIdle;
}

CoordinatorStats DebounceCoordinator::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

std::optional<core::errors::Error> DebounceCoordinator::fatal_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fatal_;
}

bool DebounceCoordinator::WaitForIdle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [this] { return !pending_.has_value() && !applying_; });
}

void DebounceCoordinator::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    cv_.wait(lock, [this] { return stopped_ || pending_.has_value(); });
    if (stopped_) {
      break;
    }

    const PendingAction scheduled = pending_.value();
    const bool superseded = cv_.wait_until(lock, scheduled.deadline, [this, &scheduled] {
      return stopped_ || !pending_.has_value() || pending_->generation != scheduled.generation;
    });
    if (stopped_) {
      break;
    }
    if (superseded) {
      // Canceled or replaced while sleeping; wait for the new occupant.
      continue;
    }

    // Expired. Consuming the slot and the intent together is what makes a
    // concurrent `OnEdge` either cancel this action or schedule a new one,
    // never both observe the same intent.
    pending_.reset();
    const std::optional<bool> intent = std::exchange(intent_, std::nullopt);
    if (!intent.has_value()) {
      ++stats_.empty_expirations;
      cv_.notify_all();
      continue;
    }

    applying_ = true;
    lock.unlock();

    core::errors::Error error;
    const bool applied = ApplyIntent(intent.value(), error);

    lock.lock();
    applying_ = false;
    ++stats_.applies_executed;
    if (applied) {
      cv_.notify_all();
      continue;
    }

    fatal_ = error;
    stopped_ = true;
    pending_.reset();
    cv_.notify_all();

    lock.unlock();
    logger_.Error("Fatal error while updating lights",
                  {{"code", core::errors::ToStableErrorCode(error.code)},
                   {"error", error.message}});
    if (on_fatal_) {
      on_fatal_(error);
    }
    lock.lock();
    break;
  }
}

bool DebounceCoordinator::ApplyIntent(const bool power_on, core::errors::Error& error) {
  logger_.Info(power_on ? "Attempting to turn on Litra device(s)"
                        : "Attempting to turn off Litra device(s)");

  return devices_.WithLock([&](devices::ILightContext& context) {
    devices::LightHandles handles;
    if (!devices::MatchDevices(context, options_.filter, options_.require_device, handles,
                               error)) {
      return false;
    }

    const devices::ApplySummary summary = devices::ApplyPower(
        handles, power_on, options_.apply_auxiliary, options_.filter, logger_);
    logger_.Debug("Light update finished",
                  {{"devices", std::to_string(summary.attempted)},
                   {"power_failures", std::to_string(summary.power_failures)},
                   {"back_light_failures", std::to_string(summary.auxiliary_failures)}});
    return true;
  });
}

} // namespace camlight::coordinator
