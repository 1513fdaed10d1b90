#include "session/session_driver.hpp"

#include "coordinator/debounce_coordinator.hpp"
#include "coordinator/shared_device_context.hpp"
#include "devices/device_matcher.hpp"

#include <optional>
#include <string>
#include <utility>

namespace camlight::session {

namespace {

using core::errors::Error;
using core::errors::ErrorCode;

bool LogConnectedDevices(const SessionOptions& options, coordinator::SharedDeviceContext& shared,
                         core::logging::Logger& logger, Error& error) {
  return shared.WithLock([&](devices::ILightContext& context) {
    devices::LightHandles handles;
    if (!devices::MatchDevices(context, options.filter, options.require_device, handles, error)) {
      return false;
    }

    if (handles.empty()) {
      devices::LogDeviceNotFound(options.filter, logger);
      return true;
    }
    for (const auto& handle : handles) {
      logger.Info("Found device",
                  {{"device_type", devices::DisplayName(handle->Type())},
                   {"serial_number", devices::SerialWithFallback(*handle)},
                   {"path", handle->Path()}});
    }
    return true;
  });
}

} // namespace

bool RunSession(const SessionOptions& options, devices::ILightContext& context,
                signals::ICameraSignalSource& source, core::logging::Logger& logger,
                Error& error) {
  core::errors::ClearError(error);

  if (!devices::ValidateDeviceFilter(options.filter, error)) {
    return false;
  }

  coordinator::SharedDeviceContext shared(context);
  if (!LogConnectedDevices(options, shared, logger, error)) {
    return false;
  }

  coordinator::CoordinatorOptions coordinator_options;
  coordinator_options.filter = options.filter;
  coordinator_options.settle_delay = options.settle_delay;
  coordinator_options.require_device = options.require_device;
  coordinator_options.apply_auxiliary = options.apply_auxiliary;

  coordinator::DebounceCoordinator debouncer(std::move(coordinator_options), shared, logger,
                                             [&source](const Error&) { source.Stop(); });

  logger.Info("Listening for camera activity",
              {{"source", source.Describe()},
               {"filter", devices::DescribeFilter(options.filter)},
               {"delay_ms", std::to_string(options.settle_delay.count())}});

  std::string source_error;
  const bool stopped_cleanly =
      source.Run([&debouncer](const bool camera_active) { debouncer.OnEdge(camera_active); },
                 source_error);
  debouncer.Shutdown();

  const std::optional<Error> fatal = debouncer.fatal_error();
  if (fatal.has_value()) {
    error = fatal.value();
    return false;
  }
  if (!stopped_cleanly) {
    core::errors::SetError(error, ErrorCode::kAdapter,
                           source_error.empty() ? "camera signal source stopped unexpectedly"
                                                : source_error);
    return false;
  }

  const coordinator::CoordinatorStats stats = debouncer.stats();
  logger.Info("Session stopped",
              {{"edges", std::to_string(stats.edges_received)},
               {"applies", std::to_string(stats.applies_executed)}});
  return true;
}

} // namespace camlight::session
