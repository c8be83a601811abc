#include "capture/status_projector.hpp"

namespace picamd::capture {

const char* ToString(const ExternalStatus status) {
  switch (status) {
  case ExternalStatus::kIdle:
    return "idle";
  case ExternalStatus::kRecording:
    return "recording";
  case ExternalStatus::kConverting:
    return "converting";
  }
  return "idle";
}

StatusView ProjectStatus(const StatusInputs& inputs) {
  StatusView view;
  view.streaming = inputs.registry_mode == CaptureMode::kStreaming;
  view.stream_subscribers = view.streaming ? inputs.streaming.subscriber_count : 0;

  if (inputs.finalization_running || inputs.registry_mode == CaptureMode::kConverting) {
    view.status = ExternalStatus::kConverting;
    return view;
  }
  if (inputs.recording_active) {
    view.status = ExternalStatus::kRecording;
    view.duration_seconds =
        std::chrono::duration<double>(inputs.recording_duration).count();
    view.start_time = inputs.recording_started_at;
    return view;
  }
  view.status = ExternalStatus::kIdle;
  return view;
}

StatusView StatusProjector::Current() const {
  StatusInputs inputs;
  inputs.finalization_running = finalization_.running();
  inputs.registry_mode = registry_.CurrentMode();
  inputs.recording_active = recording_.active();
  inputs.recording_duration = recording_.Duration();
  inputs.recording_started_at = recording_.StartedAt();
  inputs.streaming = registry_.Streaming();
  return ProjectStatus(inputs);
}

} // namespace picamd::capture
