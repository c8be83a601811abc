#pragma once

#include "backends/capture_device.hpp"
#include "core/clock.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace picamd::backends::sim {

// Deterministic, hardware-free capture device.
//
// Strict about lifecycle order so the registry and its borrowers exercise
// the same transitions a real camera enforces: a second `Open` while open
// fails with a busy error, and capture/record calls require a started device.
//
// Tuning and fault-injection parameters (`SetParam`):
//   open_error            Open fails with this text
//   start_error           Start fails with this text
//   capture_error         every CaptureFrame fails with this text
//   capture_fail_every_n  every Nth CaptureFrame fails with a timeout
//   frame_size_bytes      JPEG payload size (default 2048)
//   raw_bytes_per_frame   raw stream bytes per recorded frame (default 4096)
//   pace_frames           "false" returns frames without the 1/fps delay
class SimCaptureDevice final : public ICaptureDevice {
public:
  explicit SimCaptureDevice(core::IClock& clock = core::DefaultClock());
  ~SimCaptureDevice() override;

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

  bool SetParam(const std::string& key, const std::string& value, std::string& error);

  struct Snapshot {
    bool open = false;
    bool running = false;
    bool recording = false;
    CaptureFormat format;
    std::uint64_t open_calls = 0;
    std::uint64_t successful_opens = 0;
    std::uint64_t close_calls = 0;
    std::uint64_t start_calls = 0;
    std::uint64_t capture_calls = 0;
    std::uint64_t recordings_started = 0;
    std::uint64_t recordings_stopped = 0;
    std::uint64_t recorded_frames = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  std::string ParamOrEmpty(const std::string& key) const;
  std::uint32_t ParamOrDefault(const std::string& key, std::uint32_t fallback) const;
  bool FinishRecordingLocked(std::string& error);

  core::IClock& clock_;
  mutable std::mutex mu_;
  DeviceConfig params_;
  CaptureFormat format_;
  bool open_ = false;
  bool running_ = false;
  bool recording_ = false;
  std::ofstream raw_file_;
  std::filesystem::path raw_path_;
  core::IClock::SteadyTimePoint recording_started_at_{};
  Snapshot counters_;
};

} // namespace picamd::backends::sim
