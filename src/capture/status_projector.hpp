#pragma once

#include "capture/capture_mode.hpp"
#include "capture/device_registry.hpp"
#include "capture/finalization_pipeline.hpp"
#include "capture/recording_session.hpp"
#include "core/clock.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace picamd::capture {

enum class ExternalStatus {
  kIdle = 0,
  kRecording,
  kConverting,
};

const char* ToString(ExternalStatus status);

struct StatusInputs {
  bool finalization_running = false;
  CaptureMode registry_mode = CaptureMode::kIdle;
  bool recording_active = false;
  std::chrono::milliseconds recording_duration{0};
  std::optional<core::IClock::WallTimePoint> recording_started_at;
  StreamingState streaming;
};

struct StatusView {
  ExternalStatus status = ExternalStatus::kIdle;
  // Set only for kRecording.
  double duration_seconds = 0.0;
  std::optional<core::IClock::WallTimePoint> start_time;
  // Reported next to, not instead of, the recording status.
  bool streaming = false;
  int stream_subscribers = 0;
};

// Converting outranks Recording outranks Idle.
StatusView ProjectStatus(const StatusInputs& inputs);

// Reads the live components and projects them. Holds no state of its own;
// safe to call from any number of request handlers.
class StatusProjector {
public:
  StatusProjector(const DeviceRegistry& registry, const RecordingSession& recording,
                  const FinalizationPipeline& finalization)
      : registry_(registry), recording_(recording), finalization_(finalization) {}

  StatusView Current() const;

private:
  const DeviceRegistry& registry_;
  const RecordingSession& recording_;
  const FinalizationPipeline& finalization_;
};

} // namespace picamd::capture
