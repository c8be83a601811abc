#pragma once

#include <string>

namespace picamd::backends::webcam {

// Reports whether the OpenCV capture path was compiled into the current
// binary.
bool IsOpenCvBootstrapEnabled();

// True when the linked OpenCV can write H.264 through its FFmpeg backend.
// Recording is refused up front when this is false.
bool HasOpenCvFfmpegWriter();

// Short machine-friendly status string: `enabled` or `disabled`.
const char* OpenCvBootstrapStatusText();

// Human-readable status detail for `DumpConfig()` and `picamd version`.
std::string OpenCvBootstrapDetail();

} // namespace picamd::backends::webcam
