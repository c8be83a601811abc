#include "capture/camera_service.hpp"

#include "core/fs_utils.hpp"

#include <utility>
#include <vector>

namespace picamd::capture {

using core::errors::CaptureError;
using core::errors::CaptureErrorCode;
using core::errors::MakeDeviceError;
using core::errors::MakeError;

CameraService::CameraService(std::unique_ptr<backends::ICaptureDevice> device,
                             std::unique_ptr<transcode::ITranscoder> transcoder,
                             core::IClock& clock, core::logging::Logger& logger,
                             ServiceOptions options)
    : clock_(clock), logger_(logger), options_(std::move(options)),
      raw_path_(options_.video_dir / kRawFileName),
      final_path_(options_.video_dir / kFinalFileName), transcoder_(std::move(transcoder)),
      registry_(std::move(device), logger, options_.registry),
      config_(registry_, logger, options_.initial_config),
      finalization_(registry_, *transcoder_, clock, logger,
                    FinalizationOptions{.output_path = final_path_,
                                        .stability = options_.stability}),
      recording_(registry_, config_, finalization_, clock, logger,
                 RecordingOptions{.raw_path = raw_path_,
                                  .stop_poll_interval = options_.stop_poll_interval}),
      multiplexer_(registry_, config_, clock, logger, options_.stream),
      projector_(registry_, recording_, finalization_) {}

CameraService::~CameraService() {
  Shutdown();
}

bool CameraService::StartRecording(StartReply& reply, CaptureError& error) {
  RecordingStart started;
  if (!recording_.Start(started, error)) {
    return false;
  }
  reply.config = started.config;
  reply.requested_at = started.requested_at;
  reply.started_at = started.started_at;
  return true;
}

bool CameraService::RequestStopRecording(StopReply& reply, CaptureError& error) {
  return recording_.RequestStop(reply.elapsed_seconds, error);
}

StatusView CameraService::GetStatus() const {
  return projector_.Current();
}

CaptureConfig CameraService::GetConfig() const {
  return config_.Get();
}

bool CameraService::SetConfig(const ConfigUpdate& update, CaptureConfig& applied,
                              CaptureError& error) {
  return config_.Set(update, applied, error);
}

bool CameraService::DownloadFinal(FileReply& reply, CaptureError& error) const {
  if (finalization_.running() || registry_.CurrentMode() == CaptureMode::kConverting) {
    error = MakeError(CaptureErrorCode::kConverting, "video is converting, please wait");
    return false;
  }
  std::string detail;
  if (!core::RegularFileExists(final_path_) ||
      !core::ReadFileSize(final_path_, reply.size_bytes, detail)) {
    error = MakeError(CaptureErrorCode::kNotFound, "no video");
    return false;
  }
  reply.path = final_path_;
  reply.download_name = kFinalFileName;
  return true;
}

bool CameraService::DownloadRaw(FileReply& reply, CaptureError& error) const {
  if (recording_.active()) {
    error = MakeError(CaptureErrorCode::kStillRecording, "still recording");
    return false;
  }
  std::string detail;
  if (!core::RegularFileExists(raw_path_) ||
      !core::ReadFileSize(raw_path_, reply.size_bytes, detail)) {
    error = MakeError(CaptureErrorCode::kNotFound, "no raw video");
    return false;
  }
  reply.path = raw_path_;
  reply.download_name = kRawFileName;
  return true;
}

std::unique_ptr<Subscription> CameraService::Subscribe(CaptureError& error) {
  return multiplexer_.Subscribe(error);
}

void CameraService::ForceStopStreaming() {
  multiplexer_.ForceStop();
}

bool CameraService::CaptureStill(const std::filesystem::path& output, FileReply& reply,
                                 CaptureError& error) {
  const std::filesystem::path target =
      output.empty() ? options_.video_dir / kStillFileName : output;

  const AcquireResult acquired = registry_.Acquire(CaptureMode::kStill);
  if (!acquired.granted()) {
    error = acquired.error;
    logger_.Warn("still capture rejected", {{"error", error.message}});
    return false;
  }
  const DeviceToken token = acquired.token;
  logger_.Info("still capture started", {{"output", target.string()}});

  backends::ICaptureDevice* device = registry_.Borrow(token);
  if (device == nullptr) {
    registry_.Release(token);
    error = MakeError(CaptureErrorCode::kInternal, "still token lost during capture");
    return false;
  }

  const CaptureConfig config = config_.Get();
  const backends::CaptureFormat format{.width = config.width,
                                       .height = config.height,
                                       .fps = config.fps,
                                       .profile = backends::DeviceProfile::kStill};
  std::string detail;
  if (!device->Open(detail)) {
    return FailStill(token, "open", detail, error);
  }
  if (!device->Configure(format, detail)) {
    return FailStill(token, "configure", detail, error);
  }
  if (!device->Start(detail)) {
    return FailStill(token, "start", detail, error);
  }
  clock_.SleepFor(options_.still_warm_up);

  std::vector<std::uint8_t> jpeg;
  if (!device->CaptureFrame(jpeg, detail)) {
    return FailStill(token, "capture_frame", detail, error, CaptureErrorCode::kFrameCaptureError);
  }
  if (!device->Stop(detail)) {
    logger_.Warn("camera stop after still capture failed", {{"error", detail}});
  }
  detail.clear();
  if (!device->Close(detail)) {
    logger_.Warn("camera close after still capture failed", {{"error", detail}});
  }
  registry_.Release(token);

  if (!core::WriteBinaryFileAtomic(target, jpeg, detail)) {
    error = MakeError(CaptureErrorCode::kInternal, detail);
    logger_.Error("still capture write failed", {{"error", detail}});
    return false;
  }
  reply.path = target;
  reply.size_bytes = jpeg.size();
  reply.download_name = target.filename().string();
  logger_.Info("still capture written",
               {{"output", target.string()}, {"bytes", std::to_string(jpeg.size())}});
  return true;
}

bool CameraService::FailStill(const DeviceToken& token, const char* operation,
                              const std::string& detail, CaptureError& error,
                              const CaptureErrorCode fallback) {
  error = MakeDeviceError(operation, detail, fallback);
  logger_.Error("still capture failed", {{"operation", operation}, {"error", detail}});
  if (backends::ICaptureDevice* device = registry_.Borrow(token); device != nullptr) {
    std::string cleanup_error;
    if (!device->Close(cleanup_error)) {
      logger_.Warn("camera close after failed still failed", {{"error", cleanup_error}});
    }
  }
  if (error.code == CaptureErrorCode::kDeviceBusy) {
    registry_.ForceCloseDevice("still capture reported busy");
  }
  registry_.Release(token);
  return false;
}

void CameraService::Shutdown() {
  if (recording_.active() && !recording_.stop_pending()) {
    double elapsed = 0.0;
    CaptureError ignored;
    if (recording_.RequestStop(elapsed, ignored)) {
      logger_.Info("stopping active recording for shutdown");
    }
  }
  recording_.Wait();
  finalization_.Wait();
  multiplexer_.ForceStop();
}

} // namespace picamd::capture
