#include "core/logging/daily_file_sink.hpp"

#include "core/time_utils.hpp"

#include <system_error>
#include <utility>

namespace picamd::core::logging {

DailyFileSink::DailyFileSink(std::filesystem::path dir, std::string stem)
    : dir_(std::move(dir)), stem_(std::move(stem)) {}

bool DailyFileSink::Open(std::string& error) {
  error.clear();
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    error = "failed to create log directory '" + dir_.string() + "': " + ec.message();
    return false;
  }
  return OpenForDay(FormatLocalDate(std::chrono::system_clock::now()), error);
}

void DailyFileSink::Write(std::string_view line) {
  WriteAt(line, std::chrono::system_clock::now());
}

void DailyFileSink::WriteAt(std::string_view line, std::chrono::system_clock::time_point now) {
  const std::string day = FormatLocalDate(now);
  if (day != current_day_) {
    std::string error;
    if (!OpenForDay(day, error)) {
      return;
    }
  }
  if (!file_.is_open()) {
    return;
  }
  file_ << line;
  file_.flush();
}

std::filesystem::path DailyFileSink::CurrentPath() const {
  return dir_ / (stem_ + "-" + current_day_ + ".log");
}

bool DailyFileSink::OpenForDay(const std::string& day, std::string& error) {
  if (file_.is_open()) {
    file_.close();
  }
  current_day_ = day;
  file_.open(CurrentPath(), std::ios::binary | std::ios::app);
  if (!file_) {
    error = "failed to open log file '" + CurrentPath().string() + "'";
    return false;
  }
  return true;
}

} // namespace picamd::core::logging
