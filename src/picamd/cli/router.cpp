#include "picamd/cli/router.hpp"

#include "backends/device_factory.hpp"
#include "backends/webcam/opencv_bootstrap.hpp"
#include "capture/camera_service.hpp"
#include "core/clock.hpp"
#include "core/errors/capture_error.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "picamd/cli/options.hpp"
#include "server/http_server.hpp"
#include "transcode/transcoder.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace picamd::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDeviceFailed = core::errors::ToInt(core::errors::ExitCode::kDeviceFailed);

constexpr std::chrono::milliseconds kShutdownPollInterval{100};

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int) {
  g_stop_requested.store(true);
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  picamd serve [--host <addr>] [--port <port>] [--video-dir <dir>] "
         "[--log-dir <dir>] [--backend <sim|webcam>] [--device-index <n>] "
         "[--ffmpeg <path>] [--log-level <debug|info|warn|error>]\n"
      << "  picamd still <out.jpg> [--backend <sim|webcam>] [--device-index <n>] "
         "[--video-dir <dir>] [--log-level <debug|info|warn|error>]\n"
      << "  picamd version\n";
}

std::string InstanceId() {
  return "picamd-" + std::to_string(static_cast<long>(::getpid()));
}

// Device-level failures get their own exit code so service managers can tell
// a missing camera from a bad invocation.
bool IsDeviceFailure(const core::errors::CaptureError& error) {
  using core::errors::CaptureErrorCode;
  return error.code == CaptureErrorCode::kDeviceBusy ||
         error.code == CaptureErrorCode::kUnavailable ||
         error.code == CaptureErrorCode::kFrameCaptureError;
}

bool CheckBackend(backends::BackendKind kind, core::logging::Logger& logger) {
  const backends::BackendAvailability availability = backends::GetBackendAvailability(kind);
  if (availability.available) {
    return true;
  }
  logger.Error("capture backend unavailable",
               {{"backend", backends::ToString(kind)}, {"reason", availability.reason}});
  std::cerr << "error: backend " << backends::ToString(kind)
            << " is unavailable: " << availability.reason << '\n';
  return false;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "picamd 0.1.0\n";
  for (const backends::BackendKind kind : {backends::BackendKind::kSim,
                                           backends::BackendKind::kWebcam}) {
    const backends::BackendAvailability availability = backends::GetBackendAvailability(kind);
    std::cout << "backend " << backends::ToString(kind) << ": "
              << (availability.available ? "available" : "unavailable");
    if (!availability.available) {
      std::cout << " (" << availability.reason << ")";
    }
    std::cout << '\n';
  }
  std::cout << "opencv: " << backends::webcam::OpenCvBootstrapDetail() << '\n';
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args) {
  ServeOptions options;
  std::string error;
  if (!ParseServeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetInstanceId(InstanceId());
  if (!logger.AttachDailyFile(options.log_dir, error)) {
    std::cerr << "error: failed to open log directory: " << error << '\n';
    return kExitFailure;
  }
  if (!CheckBackend(options.backend, logger)) {
    return kExitDeviceFailed;
  }

  core::SystemClock clock;
  capture::ServiceOptions service_options;
  service_options.video_dir = options.video_dir;
  capture::CameraService service(
      backends::CreateCaptureDevice(
          backends::DeviceOptions{.kind = options.backend, .device_index = options.device_index},
          clock),
      std::make_unique<transcode::FfmpegTranscoder>(options.ffmpeg_binary), clock, logger,
      service_options);

  server::HttpServer http(service, logger,
                          server::HttpServerOptions{.host = options.host, .port = options.port});
  if (!http.Start(error)) {
    logger.Error("http server failed to start", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  logger.Info("picamd started",
              {{"backend", backends::ToString(options.backend)},
               {"video_dir", options.video_dir.string()},
               {"ffmpeg", options.ffmpeg_binary}});

  g_stop_requested.store(false);
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(kShutdownPollInterval);
  }

  logger.Info("shutdown signal received");
  http.Stop();
  service.Shutdown();
  logger.Info("picamd stopped");
  return kExitSuccess;
}

int CommandStill(const std::vector<std::string_view>& args) {
  StillOptions options;
  std::string error;
  if (!ParseStillOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetInstanceId(InstanceId());
  if (!CheckBackend(options.backend, logger)) {
    return kExitDeviceFailed;
  }

  core::SystemClock clock;
  capture::ServiceOptions service_options;
  service_options.video_dir = options.video_dir;
  capture::CameraService service(
      backends::CreateCaptureDevice(
          backends::DeviceOptions{.kind = options.backend, .device_index = options.device_index},
          clock),
      std::make_unique<transcode::FfmpegTranscoder>(), clock, logger, service_options);

  capture::FileReply reply;
  core::errors::CaptureError capture_error;
  if (!service.CaptureStill(options.output_path, reply, capture_error)) {
    std::cerr << "error: " << core::errors::FormatCaptureError(capture_error) << '\n';
    return IsDeviceFailure(capture_error) ? kExitDeviceFailed : kExitFailure;
  }

  std::cout << "still: " << reply.path.string() << " (" << reply.size_bytes << " bytes)\n";
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "serve") {
    return CommandServe(args);
  }

  if (command == "still") {
    return CommandStill(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace picamd::cli
