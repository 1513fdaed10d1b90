#include "../common/assertions.hpp"
#include "core/logging/logger.hpp"
#include "devices/device_applier.hpp"
#include "devices/device_matcher.hpp"
#include "devices/testing/fake_light_context.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using camlight::core::errors::Error;
using camlight::devices::ApplySummary;
using camlight::devices::DeviceFilter;
using camlight::devices::DeviceType;
using camlight::devices::LightHandles;
using camlight::devices::testing::FakeCommand;
using camlight::devices::testing::FakeDeviceSpec;
using camlight::devices::testing::FakeLightContext;
using camlight::tests::common::AssertContains;
using camlight::tests::common::CountOccurrences;
using camlight::tests::common::Fail;

FakeDeviceSpec Device(DeviceType type, std::string path, std::uint16_t product_id,
                      std::string serial) {
  FakeDeviceSpec spec;
  spec.info.type = type;
  spec.info.path = std::move(path);
  spec.info.product_id = product_id;
  spec.serial = std::move(serial);
  return spec;
}

LightHandles MatchAll(FakeLightContext& context) {
  LightHandles handles;
  Error error;
  if (!camlight::devices::MatchDevices(context, DeviceFilter{}, false, handles, error)) {
    Fail("match failed: " + error.message);
  }
  return handles;
}

// Three lights, the middle one rejects power commands. The other two must
// still be driven and the failure only shows up in the log.
void CheckFailureIsIsolated() {
  std::vector<FakeDeviceSpec> devices = {
      Device(DeviceType::kGlow, "/dev/hidraw0", 0xc900, "A"),
      Device(DeviceType::kBeam, "/dev/hidraw1", 0xc901, "B"),
      Device(DeviceType::kGlow, "/dev/hidraw2", 0xc900, "C"),
  };
  devices[1].fail_power = true;
  FakeLightContext context(devices);

  std::ostringstream out;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, out);
  const LightHandles handles = MatchAll(context);
  const ApplySummary summary =
      camlight::devices::ApplyPower(handles, true, false, DeviceFilter{}, logger);

  if (summary.attempted != 3U || summary.power_failures != 1U) {
    Fail("expected three attempts with one failure");
  }

  const std::vector<FakeCommand> commands = context.Commands();
  if (commands.size() != 3U) {
    Fail("expected one power command per device");
  }
  if (commands[0].path != "/dev/hidraw0" || !commands[0].succeeded || !commands[0].on) {
    Fail("first device should be turned on");
  }
  if (commands[1].path != "/dev/hidraw1" || commands[1].succeeded) {
    Fail("second device should record a failed command");
  }
  if (commands[2].path != "/dev/hidraw2" || !commands[2].succeeded) {
    Fail("third device should still be turned on after the failure");
  }

  const std::string text = out.str();
  if (CountOccurrences(text, "msg=\"Turning on device\"") != 3U) {
    Fail("expected one 'Turning on device' line per device");
  }
  AssertContains(text, "PER_DEVICE_APPLY_ERROR");
  AssertContains(text, "serial_number=\"B\"");
}

void CheckBackLightOnlyForBeamLx() {
  std::vector<FakeDeviceSpec> devices = {
      Device(DeviceType::kBeamLx, "/dev/hidraw0", 0xc903, "LX"),
      Device(DeviceType::kGlow, "/dev/hidraw1", 0xc900, "G"),
  };
  FakeLightContext context(devices);
  std::ostringstream out;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, out);

  const ApplySummary summary =
      camlight::devices::ApplyPower(MatchAll(context), false, true, DeviceFilter{}, logger);
  if (summary.attempted != 2U || summary.auxiliary_attempted != 1U) {
    Fail("back light must be driven only on Beam LX");
  }

  const std::vector<FakeCommand> commands = context.Commands();
  if (commands.size() != 3U) {
    Fail("expected two power commands and one back light command");
  }
  if (commands[0].auxiliary || commands[0].on || !commands[1].auxiliary ||
      commands[1].path != "/dev/hidraw0" || commands[1].on) {
    Fail("Beam LX should receive power then back light, both off");
  }
  if (commands[2].path != "/dev/hidraw1" || commands[2].auxiliary) {
    Fail("Glow should receive only the power command");
  }
}

void CheckBackLightRunsEvenWhenPowerFails() {
  std::vector<FakeDeviceSpec> devices = {
      Device(DeviceType::kBeamLx, "/dev/hidraw0", 0xc903, "LX"),
  };
  devices[0].fail_power = true;
  FakeLightContext context(devices);
  std::ostringstream out;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, out);

  const ApplySummary summary =
      camlight::devices::ApplyPower(MatchAll(context), true, true, DeviceFilter{}, logger);
  if (summary.power_failures != 1U || summary.auxiliary_attempted != 1U ||
      summary.auxiliary_failures != 0U) {
    Fail("back light must be attempted independently of the power result");
  }
}

void CheckEmptyPassLogsNotFound() {
  FakeLightContext context;
  std::ostringstream out;
  camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, out);

  const ApplySummary summary =
      camlight::devices::ApplyPower(MatchAll(context), true, false, DeviceFilter{}, logger);
  if (summary.attempted != 0U || !context.Commands().empty()) {
    Fail("empty pass must not issue commands");
  }
  AssertContains(out.str(), "No Litra devices found");
}

} // namespace

int main() {
  CheckFailureIsIsolated();
  CheckBackLightOnlyForBeamLx();
  CheckBackLightRunsEvenWhenPowerFails();
  CheckEmptyPassLogsNotFound();

  std::cout << "device_applier_smoke: ok\n";
  return 0;
}
