#include "camlight/cli/router.hpp"

#include "config/config_file.hpp"
#include "core/errors/error.hpp"
#include "core/errors/exit_codes.hpp"
#include "devices/light_context_factory.hpp"
#include "session/session_driver.hpp"
#include "signals/signal_source_factory.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <signal.h>

namespace camlight::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitSignalSourceFailed =
    core::errors::ToInt(core::errors::ExitCode::kSignalSourceFailed);

// Source that SIGINT/SIGTERM should stop. Platform sources only touch an
// atomic flag and a pipe in `Stop`, which is safe from a handler.
std::atomic<signals::ICameraSignalSource*> g_active_source{nullptr};

void HandleStopSignal(int /*signal_number*/) {
  signals::ICameraSignalSource* source = g_active_source.load();
  if (source != nullptr) {
    source->Stop();
  }
}

// Routes SIGINT/SIGTERM to `source.Stop()` for its lifetime and restores the
// previous dispositions afterwards.
class ScopedStopOnSignal {
public:
  explicit ScopedStopOnSignal(signals::ICameraSignalSource& source) {
    g_active_source.store(&source);

    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    installed_int_ = sigaction(SIGINT, &action, &previous_int_) == 0;
    installed_term_ = sigaction(SIGTERM, &action, &previous_term_) == 0;
  }

  ~ScopedStopOnSignal() {
    if (installed_int_) {
      sigaction(SIGINT, &previous_int_, nullptr);
    }
    if (installed_term_) {
      sigaction(SIGTERM, &previous_term_, nullptr);
    }
    g_active_source.store(nullptr);
  }

  ScopedStopOnSignal(const ScopedStopOnSignal&) = delete;
  ScopedStopOnSignal& operator=(const ScopedStopOnSignal&) = delete;

  bool installed() const {
    return installed_int_ && installed_term_;
  }

private:
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
  bool installed_int_ = false;
  bool installed_term_ = false;
};

int ReportConfigError(const core::errors::Error& error) {
  std::cerr << "error: " << core::errors::FormatError(error) << '\n';
  return core::errors::ToInt(core::errors::ExitCodeFor(error.code));
}

} // namespace

std::string_view VersionString() {
  return "camlight 0.1.0";
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camlight [--config-file|-c <path>] [--serial-number|-s <serial>]...\n"
      << "           [--device-path|-p <path>] [--device-type|-y <glow|beam|beam_lx>]\n"
      << "           [--require-device|-r] [--video-device|-d <path>] [--delay|-t <ms>]\n"
      << "           [--back|-b] [--verbose|-v] [--log-level <"
      << core::logging::ExpectedLogLevelList() << ">]\n"
      << "  camlight --version\n"
      << "  camlight --help\n"
      << "\n"
      << "Turns Litra lights on while a webcam is in use and off when it is released.\n"
      << "Only one of --serial-number, --device-path or --device-type may be given.\n"
      << "--delay defaults to 1500 ms.\n";
}

int ExecuteWatch(const ResolvedOptions& options, devices::ILightContext& context,
                 signals::ICameraSignalSource& source, core::logging::Logger& logger) {
  core::errors::Error error;
  if (session::RunSession(options.session, context, source, logger, error)) {
    return kExitSuccess;
  }

  logger.Error("Session failed", {{"code", core::errors::ToStableErrorCode(error.code)},
                                  {"error", error.message}});
  return core::errors::ToInt(core::errors::ExitCodeFor(error.code));
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions cli;
  std::string parse_error;
  if (!ParseCliArgs(args, cli, parse_error)) {
    std::cerr << "error: " << parse_error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (cli.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (cli.show_version) {
    std::cout << VersionString() << '\n';
    return kExitSuccess;
  }

  core::errors::Error error;
  std::optional<config::ConfigFile> file;
  if (cli.config_file.has_value()) {
    config::ConfigFile loaded;
    if (!config::LoadConfigFile(cli.config_file.value(), loaded, error)) {
      return ReportConfigError(error);
    }
    file = std::move(loaded);
  }

  ResolvedOptions resolved;
  if (!ResolveOptions(cli, file, resolved, error)) {
    return ReportConfigError(error);
  }

  core::logging::Logger logger(resolved.log_level);
  if (cli.config_file.has_value()) {
    logger.Debug("Loaded config file", {{"path", cli.config_file.value()}});
  }

  std::string setup_error;
  std::unique_ptr<devices::ILightContext> context;
  if (!devices::CreatePlatformLightContext(context, setup_error)) {
    logger.Error("Failed to initialize light context", {{"error", setup_error}});
    return kExitFailure;
  }

  signals::SignalSourceOptions source_options;
  source_options.video_device = resolved.video_device;
  std::unique_ptr<signals::ICameraSignalSource> source;
  if (!signals::CreatePlatformSignalSource(source_options, logger, source, setup_error)) {
    logger.Error("Failed to initialize camera monitoring", {{"error", setup_error}});
    return kExitSignalSourceFailed;
  }

  ScopedStopOnSignal stop_on_signal(*source);
  if (!stop_on_signal.installed()) {
    logger.Warn("Failed to install SIGINT/SIGTERM handlers; stop with SIGKILL");
  }
  return ExecuteWatch(resolved, *context, *source, logger);
}

} // namespace camlight::cli
