#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace picamd::core::logging {

// Append-only log file named after the local calendar day.
//
// Lines are appended to `<dir>/<stem>-YYYYMMDD.log`; the file is switched the
// first time a line is written on a new day. Deleting old days is left to the
// host (logrotate, tmpfiles.d). Not thread-safe on its own: `Logger`
// serializes writes.
class DailyFileSink {
public:
  DailyFileSink(std::filesystem::path dir, std::string stem);

  DailyFileSink(const DailyFileSink&) = delete;
  DailyFileSink& operator=(const DailyFileSink&) = delete;

  // Creates the directory and opens today's file.
  bool Open(std::string& error);

  // Appends one pre-formatted line. Write failures are swallowed because the
  // console stream still carries the line.
  void Write(std::string_view line);

  std::filesystem::path CurrentPath() const;

  // Test seam: evaluates rotation against an explicit timestamp.
  void WriteAt(std::string_view line, std::chrono::system_clock::time_point now);

private:
  bool OpenForDay(const std::string& day, std::string& error);

  std::filesystem::path dir_;
  std::string stem_;
  std::string current_day_;
  std::ofstream file_;
};

} // namespace picamd::core::logging
