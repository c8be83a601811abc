#include "core/logging/daily_file_sink.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>

namespace {

std::size_t CountLines(const std::string& text) {
  std::size_t count = 0;
  for (const char c : text) {
    if (c == '\n') {
      ++count;
    }
  }
  return count;
}

} // namespace

TEST_CASE("Log level parsing accepts the four documented names", "[core][logging]") {
  using picamd::core::logging::LogLevel;
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(picamd::core::logging::ParseLogLevel("debug", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(picamd::core::logging::ParseLogLevel("WARN", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE_FALSE(picamd::core::logging::ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("verbose") != std::string::npos);
}

TEST_CASE("Logger writes key/value lines and filters by level", "[core][logging]") {
  std::ostringstream out;
  picamd::core::logging::Logger logger(picamd::core::logging::LogLevel::kInfo, out);
  logger.SetInstanceId("picamd-42");

  logger.Debug("hidden");
  logger.Info("recording started", {{"resolution", "1280x720"}, {"fps", "30"}});
  logger.Warn("quoted \"detail\"");

  const std::string text = out.str();
  REQUIRE(CountLines(text) == 2U);
  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find("level=INFO run_id=\"picamd-42\" msg=\"recording started\" "
                    "resolution=\"1280x720\" fps=\"30\"") != std::string::npos);
  REQUIRE(text.find("msg=\"quoted \\\"detail\\\"\"") != std::string::npos);
  REQUIRE(text.rfind("ts_utc=", 0) == 0U);
}

TEST_CASE("Logger mirrors lines into the daily log file", "[core][logging]") {
  const picamd::tests::common::ScopedTempDir temp("picamd-logger-test");
  std::ostringstream out;
  picamd::core::logging::Logger logger(picamd::core::logging::LogLevel::kInfo, out);

  std::string error;
  REQUIRE(logger.AttachDailyFile(temp.path() / "log", error));
  logger.Info("daemon started");

  const std::filesystem::path expected =
      temp.path() / "log" /
      ("picamd-" + picamd::core::FormatLocalDate(std::chrono::system_clock::now()) + ".log");
  REQUIRE(std::filesystem::exists(expected));
  REQUIRE(picamd::tests::common::ReadFileToString(expected).find("msg=\"daemon started\"") !=
          std::string::npos);
}

TEST_CASE("Daily file sink switches files when the local date changes", "[core][logging]") {
  const picamd::tests::common::ScopedTempDir temp("picamd-daily-sink-test");
  picamd::core::logging::DailyFileSink sink(temp.path(), "picamd");
  std::string error;
  REQUIRE(sink.Open(error));

  const auto day_one = std::chrono::system_clock::time_point(std::chrono::hours(24 * 19'700));
  const auto day_three = day_one + std::chrono::hours(48);
  sink.WriteAt("first\n", day_one);
  const std::filesystem::path first_path = sink.CurrentPath();
  sink.WriteAt("second\n", day_three);
  const std::filesystem::path second_path = sink.CurrentPath();

  REQUIRE(first_path != second_path);
  REQUIRE(first_path.filename().string() ==
          "picamd-" + picamd::core::FormatLocalDate(day_one) + ".log");
  REQUIRE(picamd::tests::common::ReadFileToString(first_path) == "first\n");
  REQUIRE(picamd::tests::common::ReadFileToString(second_path) == "second\n");
}
