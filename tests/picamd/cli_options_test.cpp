#include "picamd/cli/options.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <vector>

using picamd::backends::BackendKind;

TEST_CASE("Serve options default to a stock deployment", "[cli]") {
  picamd::cli::ServeOptions options;
  std::string error;
  REQUIRE(picamd::cli::ParseServeOptions({}, options, error));
  REQUIRE(options.host == "0.0.0.0");
  REQUIRE(options.port == 5000);
  REQUIRE(options.video_dir == "video");
  REQUIRE(options.log_dir == "log");
  REQUIRE(options.backend == BackendKind::kWebcam);
  REQUIRE(options.ffmpeg_binary == "ffmpeg");
}

TEST_CASE("Serve options parse every flag", "[cli]") {
  const std::vector<std::string_view> args = {
      "--host",      "127.0.0.1", "--port",         "8080",  "--video-dir", "/tmp/v",
      "--log-dir",   "/tmp/l",    "--backend",      "sim",   "--device-index", "2",
      "--ffmpeg",    "/opt/ffmpeg", "--log-level",  "debug",
  };
  picamd::cli::ServeOptions options;
  std::string error;
  REQUIRE(picamd::cli::ParseServeOptions(args, options, error));
  REQUIRE(options.host == "127.0.0.1");
  REQUIRE(options.port == 8080);
  REQUIRE(options.video_dir == "/tmp/v");
  REQUIRE(options.log_dir == "/tmp/l");
  REQUIRE(options.backend == BackendKind::kSim);
  REQUIRE(options.device_index == 2U);
  REQUIRE(options.ffmpeg_binary == "/opt/ffmpeg");
  REQUIRE(options.log_level == picamd::core::logging::LogLevel::kDebug);
}

TEST_CASE("Serve rejects unknown flags and missing values", "[cli]") {
  picamd::cli::ServeOptions options;
  std::string error;
  REQUIRE_FALSE(picamd::cli::ParseServeOptions({"--verbose"}, options, error));
  REQUIRE(error == "unknown option: --verbose");
  REQUIRE_FALSE(picamd::cli::ParseServeOptions({"--port"}, options, error));
  REQUIRE(error == "missing value for --port");
  REQUIRE_FALSE(picamd::cli::ParseServeOptions({"--port", "70000"}, options, error));
  REQUIRE(error == "invalid value for --port: 70000");
  REQUIRE_FALSE(picamd::cli::ParseServeOptions({"--backend", "v4l"}, options, error));
  REQUIRE_FALSE(picamd::cli::ParseServeOptions({"extra"}, options, error));
}

TEST_CASE("Still requires exactly one output path", "[cli]") {
  picamd::cli::StillOptions options;
  std::string error;
  REQUIRE_FALSE(picamd::cli::ParseStillOptions({}, options, error));
  REQUIRE(error == "still requires exactly 1 argument: <out.jpg>");

  REQUIRE(picamd::cli::ParseStillOptions({"shot.jpg", "--backend", "sim"}, options, error));
  REQUIRE(options.output_path == "shot.jpg");
  REQUIRE(options.backend == BackendKind::kSim);

  picamd::cli::StillOptions twice;
  REQUIRE_FALSE(picamd::cli::ParseStillOptions({"a.jpg", "b.jpg"}, twice, error));
  REQUIRE(error == "still accepts exactly 1 output path");
}
