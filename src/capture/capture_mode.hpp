#pragma once

namespace picamd::capture {

// Which consumer currently holds the camera. Exactly one non-idle mode is
// active at a time.
enum class CaptureMode {
  kIdle = 0,
  kRecording,
  kConverting,
  kStreaming,
  kStill,
};

const char* ToString(CaptureMode mode);

} // namespace picamd::capture
