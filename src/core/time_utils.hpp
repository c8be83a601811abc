#ifndef PICAMD_CORE_TIME_UTILS_HPP_
#define PICAMD_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace picamd::core {

// Canonical UTC timestamp used in log lines and status payloads.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Local calendar day as YYYYMMDD, used to name daily log files.
inline std::string FormatLocalDate(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
  if (localtime_r(&epoch_seconds, &local_time) == nullptr) {
    return "00000000";
  }

  std::ostringstream out;
  out << std::put_time(&local_time, "%Y%m%d");
  return out.str();
}

// Seconds since the Unix epoch with fractional part, as reported by status.
inline double ToEpochSeconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
}

// Fixed-point rendering for durations and sizes in logs ("2.0", "12.34").
inline std::string FormatFixed(double value, int precision = 1) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

} // namespace picamd::core

#endif // PICAMD_CORE_TIME_UTILS_HPP_
