#include "backends/webcam/opencv_capture_device.hpp"

#include "backends/webcam/opencv_bootstrap.hpp"

#include <atomic>
#include <chrono>
#include <climits>
#include <cmath>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#if PICAMD_ENABLE_WEBCAM_OPENCV
#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace picamd::backends::webcam {

namespace {

constexpr const char* kNotCompiled =
    "OpenCV capture is not compiled in this build: camera unavailable";
constexpr std::chrono::milliseconds kReadFailureBackoff(5);
constexpr int kJpegQuality = 90;

} // namespace

struct OpenCvCaptureDevice::Impl {
  std::size_t device_index = 0;
  CaptureFormat format;
  bool started = false;
  std::filesystem::path raw_path;
  std::string writer_error;

  // Guards `capture` between the writer thread and frame reads.
  mutable std::mutex capture_mu;
  std::atomic<bool> recording{false};
  std::thread writer_thread;
  std::uint64_t written_frames = 0;

#if PICAMD_ENABLE_WEBCAM_OPENCV
  cv::VideoCapture capture;
  cv::VideoWriter writer;
#endif

  bool JoinWriter(std::string& error) {
    if (!writer_thread.joinable()) {
      return true;
    }
    recording.store(false);
    writer_thread.join();
#if PICAMD_ENABLE_WEBCAM_OPENCV
    writer.release();
#endif
    if (!writer_error.empty()) {
      error = writer_error;
      writer_error.clear();
      return false;
    }
    return true;
  }
};

OpenCvCaptureDevice::OpenCvCaptureDevice(const std::size_t device_index)
    : impl_(std::make_unique<Impl>()) {
  impl_->device_index = device_index;
}

OpenCvCaptureDevice::~OpenCvCaptureDevice() {
  std::string ignored;
  (void)Close(ignored);
}

bool OpenCvCaptureDevice::Open(std::string& error) {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::lock_guard<std::mutex> lock(impl_->capture_mu);
  if (impl_->capture.isOpened()) {
    error = "webcam index " + std::to_string(impl_->device_index) +
            " is already open: device busy";
    return false;
  }
  if (impl_->device_index > static_cast<std::size_t>(INT_MAX)) {
    error = "webcam index is out of range for OpenCV: device not found";
    return false;
  }
  cv::VideoCapture capture;
  if (!capture.open(static_cast<int>(impl_->device_index), cv::CAP_V4L2) &&
      !capture.open(static_cast<int>(impl_->device_index), cv::CAP_ANY)) {
    // V4L2 reports EBUSY through a failed open; OpenCV does not expose errno,
    // so the text keeps both outcomes visible for classification.
    error = "OpenCV could not open webcam index " + std::to_string(impl_->device_index) +
            " (device busy or unavailable)";
    return false;
  }
  impl_->capture = std::move(capture);
  return true;
#else
  error = kNotCompiled;
  return false;
#endif
}

bool OpenCvCaptureDevice::Configure(const CaptureFormat& format, std::string& error) {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::lock_guard<std::mutex> lock(impl_->capture_mu);
  if (!impl_->capture.isOpened()) {
    error = "webcam device must be open before configure";
    return false;
  }
  auto& capture = impl_->capture;
  (void)capture.set(cv::CAP_PROP_FOURCC, static_cast<double>(cv::VideoWriter::fourcc('M', 'J', 'P', 'G')));
  if (!capture.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(format.width)) ||
      !capture.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(format.height))) {
    error = "OpenCV rejected resolution " + std::to_string(format.width) + "x" +
            std::to_string(format.height);
    return false;
  }
  // Some drivers ignore rate requests; the read-back below decides.
  (void)capture.set(cv::CAP_PROP_FPS, static_cast<double>(format.fps));

  switch (format.profile) {
  case DeviceProfile::kStream:
    // Preview favours steady exposure over fidelity.
    (void)capture.set(cv::CAP_PROP_AUTO_EXPOSURE, 0.75);
    (void)capture.set(cv::CAP_PROP_BUFFERSIZE, 1.0);
    break;
  case DeviceProfile::kStill:
    (void)capture.set(cv::CAP_PROP_AUTO_EXPOSURE, 0.75);
    break;
  case DeviceProfile::kVideo:
    break;
  }

  const double read_width = capture.get(cv::CAP_PROP_FRAME_WIDTH);
  const double read_height = capture.get(cv::CAP_PROP_FRAME_HEIGHT);
  if (!std::isfinite(read_width) || !std::isfinite(read_height) || read_width <= 0.0 ||
      read_height <= 0.0) {
    error = "OpenCV returned an unreadable frame size after configure";
    return false;
  }
  impl_->format = format;
  impl_->format.width = static_cast<std::uint32_t>(read_width);
  impl_->format.height = static_cast<std::uint32_t>(read_height);
  return true;
#else
  (void)format;
  error = kNotCompiled;
  return false;
#endif
}

bool OpenCvCaptureDevice::Start(std::string& error) {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::lock_guard<std::mutex> lock(impl_->capture_mu);
  if (!impl_->capture.isOpened()) {
    error = "webcam device must be open before start";
    return false;
  }
  // Pull one frame so a dead sensor fails here instead of in the stream.
  cv::Mat probe;
  if (!impl_->capture.read(probe) || probe.empty()) {
    error = "webcam produced no frame on start: device unavailable";
    return false;
  }
  impl_->started = true;
  return true;
#else
  error = kNotCompiled;
  return false;
#endif
}

bool OpenCvCaptureDevice::StartRecording(const std::filesystem::path& raw_path,
                                         std::string& error) {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  if (!impl_->started) {
    error = "webcam device must be started before start_recording";
    return false;
  }
  if (impl_->recording.load()) {
    error = "webcam device is already recording";
    return false;
  }
  if (!HasOpenCvFfmpegWriter()) {
    error = "OpenCV has no FFmpeg writer backend; cannot encode H.264";
    return false;
  }

  const cv::Size size(static_cast<int>(impl_->format.width),
                      static_cast<int>(impl_->format.height));
  if (!impl_->writer.open(raw_path.string(), cv::CAP_FFMPEG,
                          cv::VideoWriter::fourcc('H', '2', '6', '4'),
                          static_cast<double>(impl_->format.fps), size)) {
    error = "OpenCV could not open H.264 writer for '" + raw_path.string() + "'";
    return false;
  }

  impl_->raw_path = raw_path;
  impl_->written_frames = 0;
  impl_->writer_error.clear();
  impl_->recording.store(true);
  Impl* impl = impl_.get();
  impl_->writer_thread = std::thread([impl]() {
    cv::Mat frame;
    while (impl->recording.load()) {
      bool read_ok = false;
      {
        std::lock_guard<std::mutex> lock(impl->capture_mu);
        read_ok = impl->capture.read(frame);
      }
      if (!read_ok || frame.empty()) {
        std::this_thread::sleep_for(kReadFailureBackoff);
        continue;
      }
      impl->writer.write(frame);
      ++impl->written_frames;
    }
    if (impl->written_frames == 0U) {
      impl->writer_error = "webcam recording produced no frames";
    }
  });
  return true;
#else
  (void)raw_path;
  error = kNotCompiled;
  return false;
#endif
}

bool OpenCvCaptureDevice::StopRecording(std::string& error) {
  return impl_->JoinWriter(error);
}

bool OpenCvCaptureDevice::CaptureFrame(std::vector<std::uint8_t>& jpeg, std::string& error) {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  cv::Mat frame;
  {
    std::lock_guard<std::mutex> lock(impl_->capture_mu);
    if (!impl_->started) {
      error = "webcam device must be started before capture_frame";
      return false;
    }
    if (!impl_->capture.read(frame)) {
      error = "webcam frame read failed";
      return false;
    }
  }
  if (frame.empty()) {
    error = "webcam returned an empty frame";
    return false;
  }
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, kJpegQuality};
  if (!cv::imencode(".jpg", frame, jpeg, params)) {
    error = "JPEG encode failed";
    return false;
  }
  return true;
#else
  (void)jpeg;
  error = kNotCompiled;
  return false;
#endif
}

bool OpenCvCaptureDevice::Stop(std::string& error) {
  const bool ok = impl_->JoinWriter(error);
  impl_->started = false;
  return ok;
}

bool OpenCvCaptureDevice::Close(std::string& error) {
  const bool ok = Stop(error);
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::lock_guard<std::mutex> lock(impl_->capture_mu);
  if (impl_->capture.isOpened()) {
    impl_->capture.release();
  }
#endif
  return ok;
}

bool OpenCvCaptureDevice::IsOpen() const {
#if PICAMD_ENABLE_WEBCAM_OPENCV
  std::lock_guard<std::mutex> lock(impl_->capture_mu);
  return impl_->capture.isOpened();
#else
  return false;
#endif
}

DeviceConfig OpenCvCaptureDevice::DumpConfig() const {
  DeviceConfig config;
  config["backend"] = "webcam";
  config["device_index"] = std::to_string(impl_->device_index);
  config["opencv"] = OpenCvBootstrapStatusText();
  config["opencv_detail"] = OpenCvBootstrapDetail();
  config["width"] = std::to_string(impl_->format.width);
  config["height"] = std::to_string(impl_->format.height);
  config["fps"] = std::to_string(impl_->format.fps);
  config["profile"] = ToString(impl_->format.profile);
  config["started"] = impl_->started ? "true" : "false";
  config["recording"] = impl_->recording.load() ? "true" : "false";
  return config;
}

} // namespace picamd::backends::webcam
