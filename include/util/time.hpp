#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

inline std::string FormatLocal(std::chrono::system_clock::time_point tp,
                               const char *fmt) {
  std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  return FormatTm(LocalTime(tt), fmt);
}

// Timestamp used in log file names: YYYY-MM-DD-HHMMSS
inline std::string TimestampForFile() {
  return FormatLocal(std::chrono::system_clock::now(), "%Y-%m-%d-%H%M%S");
}

// Timestamp prefixed to every log line: YYYY-MM-DD HH:MM:SS,mmm
inline std::string LogTimestamp(std::chrono::system_clock::time_point tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
  std::ostringstream oss;
  oss << FormatLocal(tp, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3)
      << std::setfill('0') << ms;
  return oss.str();
}

inline std::string LogTimestamp() {
  return LogTimestamp(std::chrono::system_clock::now());
}

} // namespace timeutil
