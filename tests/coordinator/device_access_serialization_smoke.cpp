#include "../common/assertions.hpp"
#include "coordinator/debounce_coordinator.hpp"
#include "coordinator/shared_device_context.hpp"
#include "devices/device_matcher.hpp"
#include "devices/testing/fake_light_context.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using camlight::coordinator::CoordinatorOptions;
using camlight::coordinator::DebounceCoordinator;
using camlight::coordinator::SharedDeviceContext;
using camlight::devices::DeviceType;
using camlight::devices::testing::FakeDeviceSpec;
using camlight::devices::testing::FakeLightContext;
using camlight::tests::common::Fail;
using namespace std::chrono_literals;

FakeDeviceSpec Beam(const std::string& path) {
  FakeDeviceSpec spec;
  spec.info.type = DeviceType::kBeam;
  spec.info.path = path;
  spec.info.product_id = 0xc901;
  spec.serial = path;
  return spec;
}

} // namespace

// Two coordinators and an ad-hoc scan share one light context. Every pass
// takes the shared lock, so no two device commands may overlap even though
// the settle timers fire at the same moment.
int main() {
  FakeLightContext lights({Beam("/dev/hidraw0"), Beam("/dev/hidraw1"), Beam("/dev/hidraw2")});
  lights.SetCommandLatency(30ms);
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  CoordinatorOptions options;
  options.settle_delay = 20ms;
  DebounceCoordinator first(options, shared, logger);
  DebounceCoordinator second(options, shared, logger);

  first.OnEdge(true);
  second.OnEdge(false);

  std::thread scanner([&] {
    std::this_thread::sleep_for(20ms);
    shared.WithLock([&](camlight::devices::ILightContext& context) {
      camlight::devices::LightHandles handles;
      camlight::core::errors::Error error;
      if (!camlight::devices::MatchDevices(context, {}, false, handles, error)) {
        Fail("scan failed: " + error.message);
      }
      for (const auto& handle : handles) {
        std::string command_error;
        if (!handle->SetPower(true, command_error)) {
          Fail("scan command failed: " + command_error);
        }
      }
    });
  });

  if (!first.WaitForIdle(5s) || !second.WaitForIdle(5s)) {
    Fail("coordinators did not settle");
  }
  scanner.join();
  first.Shutdown();
  second.Shutdown();

  if (lights.Commands().size() != 9U) {
    Fail("expected three passes over three devices");
  }
  if (lights.max_concurrent_commands() != 1U) {
    Fail("device commands overlapped; max in flight = " +
         std::to_string(lights.max_concurrent_commands()));
  }

  std::cout << "device_access_serialization_smoke: ok\n";
  return 0;
}
