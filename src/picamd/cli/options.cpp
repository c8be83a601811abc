#include "picamd/cli/options.hpp"

#include <charconv>
#include <system_error>

namespace picamd::cli {

namespace {

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::size_t max_value,
                   std::size_t& value, std::string& error) {
  std::size_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end || parsed > max_value) {
    error = "invalid value for " + std::string(flag) + ": " + std::string(raw);
    return false;
  }
  value = parsed;
  return true;
}

// Shared flags between `serve` and `still`. Returns true when `args[i]` was
// consumed (advancing `i` past its value); `error` is set on bad input.
bool ParseDeviceFlag(const std::vector<std::string_view>& args, std::size_t& i,
                     backends::BackendKind& backend, std::size_t& device_index,
                     std::filesystem::path& video_dir, core::logging::LogLevel& log_level,
                     bool& consumed, std::string& error) {
  consumed = false;
  const std::string_view token = args[i];
  if (token != "--backend" && token != "--device-index" && token != "--video-dir" &&
      token != "--log-level") {
    return true;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(token);
    return false;
  }
  const std::string_view value = args[i + 1];
  if (token == "--backend") {
    if (!backends::ParseBackendKind(value, backend, error)) {
      return false;
    }
  } else if (token == "--device-index") {
    if (!ParseUnsigned(token, value, 255U, device_index, error)) {
      return false;
    }
  } else if (token == "--video-dir") {
    if (value.empty()) {
      error = "--video-dir must not be empty";
      return false;
    }
    video_dir = std::filesystem::path(value);
  } else {
    core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(value, parsed, error)) {
      return false;
    }
    log_level = parsed;
  }
  ++i;
  consumed = true;
  return true;
}

} // namespace

bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseDeviceFlag(args, i, options.backend, options.device_index, options.video_dir,
                         options.log_level, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (token == "--host") {
      if (i + 1 >= args.size()) {
        error = "missing value for --host";
        return false;
      }
      options.host = std::string(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--port") {
      if (i + 1 >= args.size()) {
        error = "missing value for --port";
        return false;
      }
      std::size_t port = 0;
      if (!ParseUnsigned(token, args[i + 1], 65535U, port, error)) {
        return false;
      }
      options.port = static_cast<int>(port);
      ++i;
      continue;
    }
    if (token == "--log-dir") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-dir";
        return false;
      }
      options.log_dir = std::filesystem::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--ffmpeg") {
      if (i + 1 >= args.size()) {
        error = "missing value for --ffmpeg";
        return false;
      }
      options.ffmpeg_binary = std::string(args[i + 1]);
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "serve does not accept positional arguments: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseStillOptions(const std::vector<std::string_view>& args, StillOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseDeviceFlag(args, i, options.backend, options.device_index, options.video_dir,
                         options.log_level, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.output_path.empty()) {
      error = "still accepts exactly 1 output path";
      return false;
    }
    options.output_path = std::filesystem::path(token);
  }

  if (options.output_path.empty()) {
    error = "still requires exactly 1 argument: <out.jpg>";
    return false;
  }
  return true;
}

} // namespace picamd::cli
