#pragma once

#include "core/logging/logger.hpp"
#include "devices/device_matcher.hpp"

#include <cstddef>

namespace camlight::devices {

// Per-pass counters. Failures here are never fatal; they exist so callers
// and tests can see what a best-effort pass actually did.
struct ApplySummary {
  std::size_t attempted = 0U;
  std::size_t power_failures = 0U;
  std::size_t auxiliary_attempted = 0U;
  std::size_t auxiliary_failures = 0U;
};

// Sets every handle's light to `power_on`. A failing device is logged and
// skipped; remaining devices are still driven. With `auxiliary`, devices
// that have a back light get the same value on that channel, independently
// of whether the primary command succeeded.
//
// An empty `handles` logs the "not found" observation for `filter`.
ApplySummary ApplyPower(const LightHandles& handles, bool power_on, bool auxiliary,
                        const DeviceFilter& filter, core::logging::Logger& logger);

} // namespace camlight::devices
