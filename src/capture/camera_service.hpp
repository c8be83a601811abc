#pragma once

#include "backends/capture_device.hpp"
#include "capture/capture_config.hpp"
#include "capture/device_registry.hpp"
#include "capture/file_stability.hpp"
#include "capture/finalization_pipeline.hpp"
#include "capture/recording_session.hpp"
#include "capture/status_projector.hpp"
#include "capture/stream_multiplexer.hpp"
#include "core/clock.hpp"
#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"
#include "transcode/transcoder.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace picamd::capture {

inline constexpr const char* kRawFileName = "camera_video.h264";
inline constexpr const char* kFinalFileName = "camera_video.mp4";
inline constexpr const char* kStillFileName = "test.jpg";

struct ServiceOptions {
  std::filesystem::path video_dir = "video";
  CaptureConfig initial_config;
  RegistryOptions registry;
  StreamOptions stream;
  StabilityOptions stability;
  std::chrono::milliseconds stop_poll_interval{100};
  std::chrono::milliseconds still_warm_up{2000};
};

struct StartReply {
  CaptureConfig config;
  core::IClock::WallTimePoint requested_at{};
  core::IClock::WallTimePoint started_at{};
};

struct StopReply {
  double elapsed_seconds = 0.0;
};

struct FileReply {
  std::filesystem::path path;
  std::uintmax_t size_bytes = 0;
  // File name suggested to HTTP clients.
  std::string download_name;
};

// Operation surface consumed by the dispatch layers (HTTP and CLI).
//
// Owns the registry and every worker-backed component. Each operation
// returns success or a `CaptureError` whose code tells caller misuse from
// system failure; none of them is a silent no-op.
class CameraService {
public:
  CameraService(std::unique_ptr<backends::ICaptureDevice> device,
                std::unique_ptr<transcode::ITranscoder> transcoder, core::IClock& clock,
                core::logging::Logger& logger, ServiceOptions options);
  ~CameraService();

  CameraService(const CameraService&) = delete;
  CameraService& operator=(const CameraService&) = delete;

  bool StartRecording(StartReply& reply, core::errors::CaptureError& error);
  bool RequestStopRecording(StopReply& reply, core::errors::CaptureError& error);
  StatusView GetStatus() const;
  CaptureConfig GetConfig() const;
  bool SetConfig(const ConfigUpdate& update, CaptureConfig& applied,
                 core::errors::CaptureError& error);
  bool DownloadFinal(FileReply& reply, core::errors::CaptureError& error) const;
  bool DownloadRaw(FileReply& reply, core::errors::CaptureError& error) const;
  std::unique_ptr<Subscription> Subscribe(core::errors::CaptureError& error);
  void ForceStopStreaming();

  // Writes one JPEG to `output` (the video directory's test.jpg when empty).
  bool CaptureStill(const std::filesystem::path& output, FileReply& reply,
                    core::errors::CaptureError& error);

  // Stops an active recording and waits for every worker. Idempotent.
  void Shutdown();

  const std::filesystem::path& raw_path() const {
    return raw_path_;
  }
  const std::filesystem::path& final_path() const {
    return final_path_;
  }
  const DeviceRegistry& registry() const {
    return registry_;
  }
  const FinalizationPipeline& finalization() const {
    return finalization_;
  }
  const StreamMultiplexer& multiplexer() const {
    return multiplexer_;
  }

private:
  bool FailStill(const DeviceToken& token, const char* operation, const std::string& detail,
                 core::errors::CaptureError& error,
                 core::errors::CaptureErrorCode fallback = core::errors::CaptureErrorCode::kInternal);

  core::IClock& clock_;
  core::logging::Logger& logger_;
  ServiceOptions options_;
  std::filesystem::path raw_path_;
  std::filesystem::path final_path_;

  std::unique_ptr<transcode::ITranscoder> transcoder_;
  DeviceRegistry registry_;
  ConfigStore config_;
  FinalizationPipeline finalization_;
  RecordingSession recording_;
  StreamMultiplexer multiplexer_;
  StatusProjector projector_;
};

} // namespace picamd::capture
