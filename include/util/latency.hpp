#pragma once

#include <chrono>

// namespace lat: timing helpers for per-transfer latency measurement.
namespace lat {

using Clock = std::chrono::steady_clock;

// Stopwatch started on construction; reports elapsed wall time in seconds.
class Stopwatch {
public:
  Stopwatch() : start_(Clock::now()) {}

  double ElapsedSeconds() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
  }

private:
  Clock::time_point start_;
};

} // namespace lat
