#pragma once

#include "backends/capture_device.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace picamd::backends::webcam {

// OpenCV-backed camera used by the daemon on real hardware.
//
// Responsibilities:
// - open/close a device index with OpenCV VideoCapture
// - apply the requested size/rate plus a per-profile preset
// - record: a writer thread reads frames and feeds a VideoWriter that emits
//   an H.264 elementary stream to the raw path
// - capture: read one frame and JPEG-encode it
//
// Builds without OpenCV keep the same API and report every hardware call as
// "not compiled", which classifies as an unavailable device.
class OpenCvCaptureDevice final : public ICaptureDevice {
public:
  explicit OpenCvCaptureDevice(std::size_t device_index);
  ~OpenCvCaptureDevice() override;

  OpenCvCaptureDevice(const OpenCvCaptureDevice&) = delete;
  OpenCvCaptureDevice& operator=(const OpenCvCaptureDevice&) = delete;

  bool Open(std::string& error) override;
  bool Configure(const CaptureFormat& format, std::string& error) override;
  bool Start(std::string& error) override;
  bool StartRecording(const std::filesystem::path& raw_path, std::string& error) override;
  bool StopRecording(std::string& error) override;
  bool CaptureFrame(std::vector<std::uint8_t>& jpeg, std::string& error) override;
  bool Stop(std::string& error) override;
  bool Close(std::string& error) override;
  bool IsOpen() const override;
  DeviceConfig DumpConfig() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace picamd::backends::webcam
