#include "backends/webcam/opencv_bootstrap.hpp"

#include <string>

#if PICAMD_ENABLE_WEBCAM_OPENCV
#include <opencv2/core/version.hpp>
#include <opencv2/videoio/registry.hpp>
#endif

namespace picamd::backends::webcam {

bool IsOpenCvBootstrapEnabled() {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  return true;
#else
  return false;
#endif
}

bool HasOpenCvFfmpegWriter() {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  return cv::videoio_registry::hasBackend(cv::CAP_FFMPEG);
#else
  return false;
#endif
}

const char* OpenCvBootstrapStatusText() {
  return IsOpenCvBootstrapEnabled() ? "enabled" : "disabled";
}

std::string OpenCvBootstrapDetail() {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::string detail = std::string("OpenCV capture compiled (OpenCV ") + CV_VERSION + ", ffmpeg writer ";
  detail += HasOpenCvFfmpegWriter() ? "available)" : "missing)";
  return detail;
#else
  return "OpenCV capture not compiled";
#endif
}

} // namespace picamd::backends::webcam
