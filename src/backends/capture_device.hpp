#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace picamd::backends {

// Tuning preset applied on top of the size/rate request.
//
// `kStream` selects a color/exposure tuned preview format that differs from
// the recording format; `kStill` selects the full-quality still pipeline.
enum class DeviceProfile {
  kVideo = 0,
  kStream,
  kStill,
};

const char* ToString(DeviceProfile profile);

struct CaptureFormat {
  std::uint32_t width = 1280;
  std::uint32_t height = 720;
  std::uint32_t fps = 30;
  DeviceProfile profile = DeviceProfile::kVideo;
};

using DeviceConfig = std::map<std::string, std::string>;

// Camera contract used by the device registry and its borrowers.
//
// Contract goals:
// - keep hardware lifecycle explicit (`open -> configure -> start -> stop -> close`)
// - recording writes the raw encoder stream straight to a file path
// - frame capture returns one encoded JPEG still from a started device
// - `Stop` and `Close` are idempotent so cleanup paths can call them freely
//
// Implementations are not required to be thread-safe; the registry
// guarantees a single owner and borrowers serialize their own calls.
class ICaptureDevice {
public:
  virtual ~ICaptureDevice() = default;

  virtual bool Open(std::string& error) = 0;
  virtual bool Configure(const CaptureFormat& format, std::string& error) = 0;
  virtual bool Start(std::string& error) = 0;

  // Begins writing the raw stream to `raw_path` (truncating it).
  virtual bool StartRecording(const std::filesystem::path& raw_path, std::string& error) = 0;

  // Flushes and closes the raw stream. No-op when not recording.
  virtual bool StopRecording(std::string& error) = 0;

  virtual bool CaptureFrame(std::vector<std::uint8_t>& jpeg, std::string& error) = 0;

  virtual bool Stop(std::string& error) = 0;
  virtual bool Close(std::string& error) = 0;

  virtual bool IsOpen() const = 0;

  // Snapshot of backend identity and current settings for logs.
  virtual DeviceConfig DumpConfig() const = 0;
};

} // namespace picamd::backends
