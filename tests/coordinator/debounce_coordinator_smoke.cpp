#include "../common/assertions.hpp"
#include "coordinator/debounce_coordinator.hpp"
#include "coordinator/shared_device_context.hpp"
#include "devices/testing/fake_light_context.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using camlight::coordinator::CoordinatorOptions;
using camlight::coordinator::CoordinatorState;
using camlight::coordinator::CoordinatorStats;
using camlight::coordinator::DebounceCoordinator;
using camlight::coordinator::SharedDeviceContext;
using camlight::core::errors::Error;
using camlight::core::errors::ErrorCode;
using camlight::devices::DeviceType;
using camlight::devices::testing::FakeCommand;
using camlight::devices::testing::FakeDeviceSpec;
using camlight::devices::testing::FakeLightContext;
using camlight::tests::common::AssertContains;
using camlight::tests::common::Fail;
using namespace std::chrono_literals;

constexpr std::chrono::milliseconds kIdleTimeout = 5s;

FakeDeviceSpec Glow(const std::string& path, const std::string& serial) {
  FakeDeviceSpec spec;
  spec.info.type = DeviceType::kGlow;
  spec.info.path = path;
  spec.info.product_id = 0xc900;
  spec.serial = serial;
  return spec;
}

CoordinatorOptions Options(std::chrono::milliseconds delay) {
  CoordinatorOptions options;
  options.settle_delay = delay;
  return options;
}

void WaitIdleOrFail(const DebounceCoordinator& coordinator, const char* context) {
  if (!coordinator.WaitForIdle(kIdleTimeout)) {
    Fail(std::string("coordinator did not settle: ") + context);
  }
}

// A quick on/off/on burst collapses into a single "on" pass.
void CheckBurstCollapsesToOneApply() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kDebug, log);

  {
    DebounceCoordinator coordinator(Options(100ms), shared, logger);
    coordinator.OnEdge(true);
    coordinator.OnEdge(false);
    coordinator.OnEdge(true);
    if (coordinator.state() != CoordinatorState::kSettling) {
      Fail("coordinator should be settling right after edges");
    }
    WaitIdleOrFail(coordinator, "burst");

    const CoordinatorStats stats = coordinator.stats();
    if (stats.edges_received != 3U || stats.actions_scheduled != 3U ||
        stats.actions_canceled != 2U || stats.applies_executed != 1U) {
      Fail("unexpected stats after burst");
    }
    if (coordinator.state() != CoordinatorState::kIdle) {
      Fail("coordinator should be idle after the apply");
    }
  }

  const std::vector<FakeCommand> commands = lights.Commands();
  if (commands.size() != 1U || !commands[0].on) {
    Fail("burst should apply exactly one 'on' command");
  }
  if (lights.refresh_calls() != 1U) {
    Fail("devices are enumerated once per apply pass");
  }
  AssertContains(log.str(), "Attempting to turn on Litra device(s)");
}

// Many edges spaced tighter than the delay keep rescheduling; only the last
// value is applied, once.
void CheckRescheduledEdgesApplyLatestIntentOnce() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(250ms), shared, logger);
  for (int i = 0; i < 20; ++i) {
    coordinator.OnEdge(i % 2 == 0);
    std::this_thread::sleep_for(5ms);
  }
  WaitIdleOrFail(coordinator, "reschedule");
  coordinator.Shutdown();

  const std::vector<FakeCommand> commands = lights.Commands();
  if (commands.size() != 1U || commands[0].on) {
    Fail("20 rescheduled edges should apply the final 'off' once");
  }
  if (coordinator.stats().actions_canceled != 19U) {
    Fail("each reschedule should cancel the previous pending action");
  }
}

// Same intent twice in a row applies twice.
void CheckRepeatedIntentAppliesAgain() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(20ms), shared, logger);
  coordinator.OnEdge(true);
  WaitIdleOrFail(coordinator, "first on");
  coordinator.OnEdge(true);
  WaitIdleOrFail(coordinator, "second on");
  coordinator.Shutdown();

  const std::vector<FakeCommand> commands = lights.Commands();
  if (commands.size() != 2U || !commands[0].on || !commands[1].on) {
    Fail("repeated 'on' intent should drive the lights twice");
  }
}

// Shutting down while an action is pending cancels it without any device
// access.
void CheckShutdownCancelsPendingAction() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(300ms), shared, logger);
  coordinator.OnEdge(true);
  coordinator.Shutdown();
  coordinator.Shutdown();

  std::this_thread::sleep_for(400ms);
  if (!lights.Commands().empty() || lights.refresh_calls() != 0U) {
    Fail("a canceled action must not touch the devices");
  }
  if (coordinator.state() != CoordinatorState::kStopped) {
    Fail("coordinator should report stopped");
  }

  coordinator.OnEdge(false);
  if (coordinator.stats().edges_received != 1U) {
    Fail("edges after shutdown must be ignored");
  }
}

// An edge that arrives while lights are being driven schedules a follow-up
// pass with the new value.
void CheckEdgeDuringApplySchedulesFollowUp() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  lights.SetCommandLatency(150ms);
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(10ms), shared, logger);
  coordinator.OnEdge(true);
  if (!camlight::tests::common::WaitUntil([&] { return lights.refresh_calls() >= 1U; }, 2s)) {
    Fail("first apply never started");
  }
  coordinator.OnEdge(false);
  WaitIdleOrFail(coordinator, "follow-up");
  coordinator.Shutdown();

  const std::vector<FakeCommand> commands = lights.Commands();
  if (commands.size() != 2U || !commands[0].on || commands[1].on) {
    Fail("expected 'on' followed by 'off'");
  }
}

// With require_device and nothing connected the apply pass is fatal: the
// handler runs once and the coordinator stops.
void CheckRequiredDeviceMissingIsFatal() {
  FakeLightContext lights;
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  std::atomic<int> fatal_calls{0};
  CoordinatorOptions options = Options(10ms);
  options.require_device = true;
  DebounceCoordinator coordinator(options, shared, logger,
                                  [&fatal_calls](const Error&) { ++fatal_calls; });

  coordinator.OnEdge(true);
  if (!camlight::tests::common::WaitUntil([&] { return fatal_calls.load() == 1; }, 2s)) {
    Fail("fatal handler was not called");
  }
  const std::optional<Error> fatal = coordinator.fatal_error();
  if (!fatal.has_value() || fatal->code != ErrorCode::kNoDevicesFound) {
    Fail("fatal error should be NO_DEVICES_FOUND");
  }
  if (coordinator.state() != CoordinatorState::kStopped) {
    Fail("coordinator must stop after a fatal error");
  }
  coordinator.OnEdge(false);
  coordinator.Shutdown();
  if (fatal_calls.load() != 1) {
    Fail("fatal handler must run exactly once");
  }
}

// Without require_device an empty pass is only logged.
void CheckMissingDeviceWithoutRequireIsNotFatal() {
  FakeLightContext lights;
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(10ms), shared, logger);
  coordinator.OnEdge(true);
  WaitIdleOrFail(coordinator, "empty pass");
  if (coordinator.fatal_error().has_value() ||
      coordinator.state() == CoordinatorState::kStopped) {
    Fail("missing devices without require_device must not be fatal");
  }

  lights.SetDevices({Glow("/dev/hidraw0", "A")});
  coordinator.OnEdge(false);
  WaitIdleOrFail(coordinator, "after hot plug");
  coordinator.Shutdown();

  if (lights.Commands().size() != 1U) {
    Fail("hot-plugged light should be driven on the next pass");
  }
  AssertContains(log.str(), "No Litra devices found");
}

void CheckEnumerationFailureIsFatal() {
  FakeLightContext lights({Glow("/dev/hidraw0", "A")});
  lights.SetRefreshFailure(true);
  SharedDeviceContext shared(lights);
  std::ostringstream log;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

  DebounceCoordinator coordinator(Options(10ms), shared, logger);
  coordinator.OnEdge(true);
  if (!camlight::tests::common::WaitUntil(
          [&] { return coordinator.state() == CoordinatorState::kStopped; }, 2s)) {
    Fail("enumeration failure should stop the coordinator");
  }
  const std::optional<Error> fatal = coordinator.fatal_error();
  if (!fatal.has_value() || fatal->code != ErrorCode::kEnumeration) {
    Fail("fatal error should be ENUMERATION_ERROR");
  }
  coordinator.Shutdown();
  AssertContains(log.str(), "ENUMERATION_ERROR");
}

} // namespace

int main() {
  CheckBurstCollapsesToOneApply();
  CheckRescheduledEdgesApplyLatestIntentOnce();
  CheckRepeatedIntentAppliesAgain();
  CheckShutdownCancelsPendingAction();
  CheckEdgeDuringApplySchedulesFollowUp();
  CheckRequiredDeviceMissingIsFatal();
  CheckMissingDeviceWithoutRequireIsNotFatal();
  CheckEnumerationFailureIsFatal();

  std::cout << "debounce_coordinator_smoke: ok\n";
  return 0;
}
