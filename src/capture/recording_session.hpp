#pragma once

#include "capture/capture_config.hpp"
#include "capture/device_registry.hpp"
#include "capture/finalization_pipeline.hpp"
#include "core/clock.hpp"
#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>

namespace picamd::capture {

struct RecordingOptions {
  std::filesystem::path raw_path;
  // Upper bound between a stop request and the worker acting on it.
  std::chrono::milliseconds stop_poll_interval{100};
};

struct RecordingStart {
  CaptureConfig config;
  core::IClock::WallTimePoint requested_at{};
  core::IClock::WallTimePoint started_at{};
};

// One recording at a time: start -> active wait -> stop -> hand-off to
// finalization.
//
// `Start` brings the camera up on the caller's thread so device errors are
// reported to the requester, then leaves the active wait and the shutdown
// sequence to a worker. `RequestStop` only signals; the worker stops the
// device within one poll interval, releases raw capture and always hands the
// token to the finalization pipeline, which owns the way back to Idle.
//
// `startedAt` is the moment the device began writing the raw stream, which
// trails the request time by the device bring-up.
class RecordingSession {
public:
  RecordingSession(DeviceRegistry& registry, ConfigStore& config,
                   FinalizationPipeline& finalization, core::IClock& clock,
                   core::logging::Logger& logger, RecordingOptions options);
  ~RecordingSession();

  RecordingSession(const RecordingSession&) = delete;
  RecordingSession& operator=(const RecordingSession&) = delete;

  bool Start(RecordingStart& started, core::errors::CaptureError& error);

  // Fails with NotActive when nothing is recording or a stop is already
  // pending. `elapsed_seconds` is the recorded time at the request.
  bool RequestStop(double& elapsed_seconds, core::errors::CaptureError& error);

  // True from a successful `Start` until the worker handed off to
  // finalization (a pending stop still counts as active).
  bool active() const;
  bool stop_pending() const;

  // `now - startedAt`, or zero when not recording.
  std::chrono::milliseconds Duration() const;
  std::optional<core::IClock::WallTimePoint> StartedAt() const;

  const std::filesystem::path& raw_path() const {
    return options_.raw_path;
  }

  // Joins the worker, if any. Does not request a stop.
  void Wait();

private:
  void Run(DeviceToken token);
  void AbortStart(const DeviceToken& token, const char* operation, const std::string& detail,
                  core::errors::CaptureError& error);

  DeviceRegistry& registry_;
  ConfigStore& config_;
  FinalizationPipeline& finalization_;
  core::IClock& clock_;
  core::logging::Logger& logger_;
  RecordingOptions options_;

  std::mutex lifecycle_mu_;
  std::thread worker_;

  mutable std::mutex mu_;
  std::condition_variable stop_cv_;
  bool active_ = false;
  bool stop_requested_ = false;
  std::optional<core::IClock::WallTimePoint> started_at_;
  core::IClock::SteadyTimePoint started_steady_{};
};

} // namespace picamd::capture
