#pragma once

#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/error.hpp"

// One file attempt. Produced once and never modified afterwards.
struct TransferOutcome {
  std::filesystem::path file;
  double seconds = 0.0;
  bool success = false;
  std::optional<Error> error; // set when success is false
};

struct RunSummary {
  std::size_t successCount = 0;
  std::size_t errorCount = 0;
  double totalSeconds = 0.0; // successful transfers only
  std::optional<double> averageSeconds; // empty when nothing succeeded
};

inline RunSummary Summarize(const std::vector<TransferOutcome> &outcomes) {
  RunSummary s;
  for (const auto &o : outcomes) {
    if (o.success) {
      ++s.successCount;
      s.totalSeconds += o.seconds;
    } else {
      ++s.errorCount;
    }
  }
  if (s.successCount > 0) {
    s.averageSeconds = s.totalSeconds / static_cast<double>(s.successCount);
  }
  return s;
}

// Summary lines as they appear in the log; the average line is present only
// when at least one file succeeded.
inline std::vector<std::string> FormatSummary(const RunSummary &s) {
  std::vector<std::string> lines;
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << "Processed " << s.successCount
      << " files with " << s.errorCount << " errors in " << s.totalSeconds
      << " seconds.";
  lines.push_back(oss.str());
  if (s.averageSeconds.has_value()) {
    std::ostringstream avg;
    avg << std::fixed << std::setprecision(2)
        << "Average processing time per successful file: " << *s.averageSeconds
        << " seconds.";
    lines.push_back(avg.str());
  }
  return lines;
}
