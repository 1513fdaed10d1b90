#pragma once

#include "devices/light_device.hpp"

#include <mutex>

namespace camlight::coordinator {

// The one light context of a session plus the mutex that serializes every
// enumerate/open/apply pass on it. The lock is held for a single pass only,
// never across a settle delay.
class SharedDeviceContext {
public:
  explicit SharedDeviceContext(devices::ILightContext& context) : context_(context) {}

  SharedDeviceContext(const SharedDeviceContext&) = delete;
  SharedDeviceContext& operator=(const SharedDeviceContext&) = delete;

  // Runs `fn(context)` under the lock and returns its result.
  template <typename Fn>
  auto WithLock(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mu_);
    return fn(context_);
  }

private:
  devices::ILightContext& context_;
  std::mutex mu_;
};

} // namespace camlight::coordinator
