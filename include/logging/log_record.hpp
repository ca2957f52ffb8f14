#pragma once

#include <boost/lockfree/spsc_queue.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace logging {

enum class Level { info, warning, error };

inline std::string_view ToString(Level level) {
  switch (level) {
  case Level::info:
    return "INFO";
  case Level::warning:
    return "WARNING";
  case Level::error:
    return "ERROR";
  }
  return "INFO";
}

// LogRecord: fully formatted line including the trailing newline.
struct LogRecord {
  std::string line;
};

inline constexpr std::size_t kLogRingCapacity = 1u << 12;

using LogQueue =
    boost::lockfree::spsc_queue<LogRecord,
                                boost::lockfree::capacity<kLogRingCapacity>>;

} // namespace logging
