#pragma once

#include "capture/device_registry.hpp"
#include "core/errors/capture_error.hpp"
#include "core/logging/logger.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace picamd::capture {

struct Resolution {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

inline constexpr std::array<Resolution, 3> kValidResolutions = {{
    {640, 480},
    {1280, 720},
    {1920, 1080},
}};

inline constexpr std::array<std::uint32_t, 2> kValidFps = {25, 30};

inline constexpr const char* kVideoFormat = "mp4";

struct CaptureConfig {
  std::uint32_t width = 1280;
  std::uint32_t height = 720;
  std::uint32_t fps = 30;
};

// Partial update; absent members keep their stored value.
struct ConfigUpdate {
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<std::uint32_t> fps;
};

bool IsValidResolution(std::uint32_t width, std::uint32_t height);
bool IsValidFps(std::uint32_t fps);

// Checks `update` in isolation. Width and height travel together.
bool ValidateConfigUpdate(const ConfigUpdate& update, core::errors::CaptureError& error);

// "1280x720"
std::string FormatResolution(const CaptureConfig& config);

// Stored capture settings. Reads are always allowed; writes are validated
// and applied only while the registry reports Idle, atomically with respect
// to acquisitions.
class ConfigStore {
public:
  ConfigStore(DeviceRegistry& registry, core::logging::Logger& logger,
              CaptureConfig initial = {});

  CaptureConfig Get() const;

  bool Set(const ConfigUpdate& update, CaptureConfig& applied, core::errors::CaptureError& error);

private:
  DeviceRegistry& registry_;
  core::logging::Logger& logger_;
  mutable std::mutex mu_;
  CaptureConfig config_;
};

} // namespace picamd::capture
