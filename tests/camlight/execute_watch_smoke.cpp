#include "../common/assertions.hpp"
#include "camlight/cli/router.hpp"
#include "core/errors/exit_codes.hpp"
#include "devices/testing/fake_light_context.hpp"
#include "signals/testing/scripted_signal_source.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

using camlight::cli::ResolvedOptions;
using camlight::core::errors::ExitCode;
using camlight::core::errors::ToInt;
using camlight::devices::DeviceType;
using camlight::devices::testing::FakeDeviceSpec;
using camlight::devices::testing::FakeLightContext;
using camlight::signals::testing::ScriptedEdge;
using camlight::signals::testing::ScriptedSignalSource;
using camlight::tests::common::AssertContains;
using camlight::tests::common::Fail;
using namespace std::chrono_literals;

FakeDeviceSpec Glow() {
  FakeDeviceSpec spec;
  spec.info.type = DeviceType::kGlow;
  spec.info.path = "/dev/hidraw0";
  spec.info.product_id = 0xc900;
  spec.serial = "GLOW-1";
  return spec;
}

ResolvedOptions FastOptions() {
  ResolvedOptions options;
  options.session.settle_delay = 20ms;
  return options;
}

void ExpectCode(int actual, ExitCode expected, const char* context) {
  if (actual != ToInt(expected)) {
    Fail(std::string(context) + ": unexpected exit code " + std::to_string(actual));
  }
}

} // namespace

int main() {
  // Stopped externally after driving the light => success.
  {
    FakeLightContext lights({Glow()});
    ScriptedSignalSource source({ScriptedEdge{.delay_before = 0ms, .camera_active = true}});
    std::ostringstream log;
    camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);

    int exit_code = -1;
    std::thread runner([&] {
      exit_code = camlight::cli::ExecuteWatch(FastOptions(), lights, source, logger);
    });
    if (!camlight::tests::common::WaitUntil([&] { return lights.Commands().size() == 1U; }, 5s)) {
      Fail("light was never driven");
    }
    source.Stop();
    runner.join();
    ExpectCode(exit_code, ExitCode::kSuccess, "external stop");
  }

  // Required light missing => 20.
  {
    FakeLightContext lights;
    ScriptedSignalSource source({});
    std::ostringstream log;
    camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);
    ResolvedOptions options = FastOptions();
    options.session.require_device = true;
    ExpectCode(camlight::cli::ExecuteWatch(options, lights, source, logger),
               ExitCode::kDeviceNotFound, "required light missing");
    AssertContains(log.str(), "NO_DEVICES_FOUND");
  }

  // Camera source dies => 30.
  {
    FakeLightContext lights({Glow()});
    ScriptedSignalSource source({}, std::string("failed to watch /dev"));
    std::ostringstream log;
    camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);
    ExpectCode(camlight::cli::ExecuteWatch(FastOptions(), lights, source, logger),
               ExitCode::kSignalSourceFailed, "source failure");
    AssertContains(log.str(), "ADAPTER_ERROR");
  }

  // Enumeration fails => 40.
  {
    FakeLightContext lights({Glow()});
    lights.SetRefreshFailure(true);
    ScriptedSignalSource source({});
    std::ostringstream log;
    camlight::core::logging::Logger logger(camlight::core::logging::LogLevel::kInfo, log);
    ExpectCode(camlight::cli::ExecuteWatch(FastOptions(), lights, source, logger),
               ExitCode::kEnumerationFailed, "enumeration failure");
  }

  std::cout << "execute_watch_smoke: ok\n";
  return 0;
}
