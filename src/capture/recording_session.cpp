#include "capture/recording_session.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <string>
#include <utility>

namespace picamd::capture {

using core::errors::CaptureError;
using core::errors::CaptureErrorCode;
using core::errors::MakeDeviceError;
using core::errors::MakeError;

RecordingSession::RecordingSession(DeviceRegistry& registry, ConfigStore& config,
                                   FinalizationPipeline& finalization, core::IClock& clock,
                                   core::logging::Logger& logger, RecordingOptions options)
    : registry_(registry), config_(config), finalization_(finalization), clock_(clock),
      logger_(logger), options_(std::move(options)) {}

RecordingSession::~RecordingSession() {
  Wait();
}

bool RecordingSession::Start(RecordingStart& started, CaptureError& error) {
  started = RecordingStart{};
  started.requested_at = clock_.WallNow();

  const AcquireResult acquired = registry_.Acquire(CaptureMode::kRecording);
  if (!acquired.granted()) {
    error = acquired.error;
    logger_.Warn("recording start rejected",
                 {{"holder", ToString(acquired.holder)}, {"error", error.message}});
    return false;
  }
  const DeviceToken token = acquired.token;

  // The previous worker is past its hand-off once the mode was Idle again.
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  std::string detail;
  if (!core::EnsureParentDirectory(options_.raw_path, detail)) {
    registry_.Release(token);
    error = MakeError(CaptureErrorCode::kInternal, detail);
    logger_.Error("recording start failed", {{"error", detail}});
    return false;
  }

  started.config = config_.Get();
  const std::string fps_text = std::to_string(started.config.fps);
  logger_.Info("initializing camera for recording",
               {{"resolution", FormatResolution(started.config)}, {"fps", fps_text}});

  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device == nullptr) {
    registry_.Release(token);
    error = MakeError(CaptureErrorCode::kInternal, "recording token lost during start");
    return false;
  }
  const backends::CaptureFormat format{.width = started.config.width,
                                       .height = started.config.height,
                                       .fps = started.config.fps,
                                       .profile = backends::DeviceProfile::kVideo};
  if (!device->Open(detail)) {
    AbortStart(token, "open", detail, error);
    return false;
  }
  if (!device->Configure(format, detail)) {
    AbortStart(token, "configure", detail, error);
    return false;
  }
  if (!device->Start(detail)) {
    AbortStart(token, "start", detail, error);
    return false;
  }
  if (!device->StartRecording(options_.raw_path, detail)) {
    AbortStart(token, "start_recording", detail, error);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    active_ = true;
    stop_requested_ = false;
    started_at_ = clock_.WallNow();
    started_steady_ = clock_.SteadyNow();
    started.started_at = *started_at_;
  }
  logger_.Info("recording started",
               {{"raw", options_.raw_path.string()},
                {"start_time", core::FormatUtcTimestamp(started.started_at)}});

  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  worker_ = std::thread([this, token]() { Run(token); });
  return true;
}

void RecordingSession::AbortStart(const DeviceToken& token, const char* operation,
                                  const std::string& detail, CaptureError& error) {
  error = MakeDeviceError(operation, detail);
  logger_.Error("recording start failed", {{"operation", operation}, {"error", detail}});

  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device != nullptr) {
    std::string cleanup_error;
    if (!device->Close(cleanup_error)) {
      logger_.Warn("camera close after failed start failed", {{"error", cleanup_error}});
    }
  }
  if (error.code == CaptureErrorCode::kDeviceBusy) {
    registry_.ForceCloseDevice("recording start reported busy");
  }
  registry_.Release(token);
}

bool RecordingSession::RequestStop(double& elapsed_seconds, CaptureError& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_ || stop_requested_) {
      error = MakeError(CaptureErrorCode::kNotActive, "not recording");
      return false;
    }
    stop_requested_ = true;
    elapsed_seconds =
        std::chrono::duration<double>(clock_.SteadyNow() - started_steady_).count();
  }
  stop_cv_.notify_all();
  logger_.Info("recording stop requested",
               {{"elapsed_s", core::FormatFixed(elapsed_seconds, 2)},
                {"elapsed_min", core::FormatFixed(elapsed_seconds / 60.0, 2)}});
  return true;
}

void RecordingSession::Run(const DeviceToken token) {
  {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_requested_) {
      stop_cv_.wait_for(lock, options_.stop_poll_interval);
    }
  }

  const double duration_s =
      std::chrono::duration<double>(clock_.SteadyNow() - started_steady_).count();
  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device == nullptr) {
    logger_.Error("recording worker lost its device token");
  } else {
    std::string detail;
    if (!device->StopRecording(detail)) {
      logger_.Error("camera stop_recording failed", {{"error", detail}});
    }
    detail.clear();
    if (!device->Stop(detail)) {
      logger_.Warn("camera stop failed", {{"error", detail}});
    }
    detail.clear();
    if (!device->Close(detail)) {
      logger_.Warn("camera close failed", {{"error", detail}});
    }
  }
  logger_.Info("recording stopped",
               {{"duration_s", core::FormatFixed(duration_s, 2)},
                {"duration_min", core::FormatFixed(duration_s / 60.0, 2)}});

  finalization_.Begin(token, options_.raw_path);

  std::lock_guard<std::mutex> lock(mu_);
  active_ = false;
  stop_requested_ = false;
  started_at_.reset();
}

bool RecordingSession::active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

bool RecordingSession::stop_pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_ && stop_requested_;
}

std::chrono::milliseconds RecordingSession::Duration() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!active_) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_.SteadyNow() -
                                                               started_steady_);
}

std::optional<core::IClock::WallTimePoint> RecordingSession::StartedAt() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_at_;
}

void RecordingSession::Wait() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (worker_.joinable()) {
    worker_.join();
  }
}

} // namespace picamd::capture
