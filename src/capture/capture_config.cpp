#include "capture/capture_config.hpp"

#include <algorithm>

namespace picamd::capture {

using core::errors::CaptureError;
using core::errors::CaptureErrorCode;
using core::errors::MakeError;

namespace {

std::string ValidResolutionList() {
  std::string text;
  for (const Resolution& resolution : kValidResolutions) {
    if (!text.empty()) {
      text += ", ";
    }
    text += std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
  }
  return text;
}

std::string ValidFpsList() {
  std::string text;
  for (const std::uint32_t fps : kValidFps) {
    if (!text.empty()) {
      text += ", ";
    }
    text += std::to_string(fps);
  }
  return text;
}

} // namespace

bool IsValidResolution(const std::uint32_t width, const std::uint32_t height) {
  return std::any_of(kValidResolutions.begin(), kValidResolutions.end(),
                     [&](const Resolution& r) { return r.width == width && r.height == height; });
}

bool IsValidFps(const std::uint32_t fps) {
  return std::find(kValidFps.begin(), kValidFps.end(), fps) != kValidFps.end();
}

bool ValidateConfigUpdate(const ConfigUpdate& update, CaptureError& error) {
  if (update.width.has_value() != update.height.has_value()) {
    error = MakeError(CaptureErrorCode::kInvalidConfig, "width and height must be set together");
    return false;
  }
  if (update.width.has_value() && !IsValidResolution(*update.width, *update.height)) {
    error = MakeError(CaptureErrorCode::kInvalidConfig,
                      "invalid resolution " + std::to_string(*update.width) + "x" +
                          std::to_string(*update.height) + " (valid: " + ValidResolutionList() +
                          ")");
    return false;
  }
  if (update.fps.has_value() && !IsValidFps(*update.fps)) {
    error = MakeError(CaptureErrorCode::kInvalidConfig,
                      "invalid fps " + std::to_string(*update.fps) + " (valid: " +
                          ValidFpsList() + ")");
    return false;
  }
  return true;
}

std::string FormatResolution(const CaptureConfig& config) {
  return std::to_string(config.width) + "x" + std::to_string(config.height);
}

ConfigStore::ConfigStore(DeviceRegistry& registry, core::logging::Logger& logger,
                         CaptureConfig initial)
    : registry_(registry), logger_(logger), config_(initial) {}

CaptureConfig ConfigStore::Get() const {
  std::lock_guard<std::mutex> lock(mu_);
  return config_;
}

bool ConfigStore::Set(const ConfigUpdate& update, CaptureConfig& applied, CaptureError& error) {
  if (!ValidateConfigUpdate(update, error)) {
    logger_.Warn("config update rejected", {{"error", error.message}});
    return false;
  }

  const bool idle = registry_.TryWhileIdle([&]() {
    std::lock_guard<std::mutex> lock(mu_);
    if (update.width.has_value()) {
      config_.width = *update.width;
      config_.height = *update.height;
    }
    if (update.fps.has_value()) {
      config_.fps = *update.fps;
    }
    applied = config_;
  });
  if (!idle) {
    const CaptureMode mode = registry_.CurrentMode();
    error = MakeError(CaptureErrorCode::kDeviceBusy,
                      std::string("configuration can only change while idle (mode=") +
                          ToString(mode) + ")");
    logger_.Warn("config update rejected", {{"error", error.message}});
    return false;
  }

  const std::string fps_text = std::to_string(applied.fps);
  logger_.Info("config updated",
               {{"resolution", FormatResolution(applied)}, {"fps", fps_text}});
  return true;
}

} // namespace picamd::capture
