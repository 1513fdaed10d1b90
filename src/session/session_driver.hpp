#pragma once

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "devices/device_model.hpp"
#include "devices/light_device.hpp"
#include "signals/camera_signal_source.hpp"

#include <chrono>

namespace camlight::session {

// Inputs for one watch session. Mirrors the coordinator options; the signal
// source and light context are provided separately so callers can plug in
// platform or test implementations.
struct SessionOptions {
  devices::DeviceFilter filter;
  std::chrono::milliseconds settle_delay{1500};
  bool require_device = false;
  bool apply_auxiliary = false;
};

// Runs a session until the signal source stops or something fatal happens.
//
// Steps:
// 1) validate the filter
// 2) one synchronous match under the context lock, logging every light
//    found (or the not-found observation); with `require_device` an empty
//    result ends the session here
// 3) feed every edge from `source` into a debounce coordinator until `Run`
//    returns
//
// Returns true only when the source was stopped externally (for example on
// SIGINT). Returns false with:
// - the coordinator's fatal error when an apply pass failed fatally (the
//   source is stopped from the coordinator's worker)
// - `kAdapter` when the source failed on its own
bool RunSession(const SessionOptions& options, devices::ILightContext& context,
                signals::ICameraSignalSource& source, core::logging::Logger& logger,
                core::errors::Error& error);

} // namespace camlight::session
