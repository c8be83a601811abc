#pragma once

#include "backends/device_factory.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace picamd::cli {

// `picamd serve` options. Defaults match a stock deployment next to the
// daemon's working directory.
struct ServeOptions {
  std::string host = "0.0.0.0";
  int port = 5000;
  std::filesystem::path video_dir = "video";
  std::filesystem::path log_dir = "log";
  backends::BackendKind backend = backends::BackendKind::kWebcam;
  std::size_t device_index = 0;
  std::string ffmpeg_binary = "ffmpeg";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// `picamd still <out.jpg>` options.
struct StillOptions {
  std::filesystem::path output_path;
  std::filesystem::path video_dir = "video";
  backends::BackendKind backend = backends::BackendKind::kWebcam;
  std::size_t device_index = 0;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Both parsers treat unknown flags, missing values and stray positionals as
// usage errors and leave the reason in `error`.
bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error);
bool ParseStillOptions(const std::vector<std::string_view>& args, StillOptions& options,
                       std::string& error);

} // namespace picamd::cli
