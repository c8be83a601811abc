#include "capture/capture_mode.hpp"

namespace picamd::capture {

const char* ToString(const CaptureMode mode) {
  switch (mode) {
  case CaptureMode::kIdle:
    return "idle";
  case CaptureMode::kRecording:
    return "recording";
  case CaptureMode::kConverting:
    return "converting";
  case CaptureMode::kStreaming:
    return "streaming";
  case CaptureMode::kStill:
    return "still";
  }
  return "unknown";
}

} // namespace picamd::capture
