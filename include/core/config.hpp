#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// Run mode:
// - fast: statistics only
// - detailed: also logs every file sent and every successful reply
enum class Mode { fast, detailed };

inline std::optional<Mode> ParseMode(std::string_view s) {
  if (s == "fast") {
    return Mode::fast;
  }
  if (s == "detailed") {
    return Mode::detailed;
  }
  return std::nullopt;
}

inline std::string_view ToString(Mode mode) {
  return mode == Mode::detailed ? "detailed" : "fast";
}

inline constexpr std::string_view kDefaultBanner = "+RCLUSTER Version v1.10";
inline constexpr std::string_view kSuccessPrefix = "+RCLUSTER";
inline constexpr std::string_view kErrorPrefix = "-RCLUSTER";
inline constexpr std::chrono::seconds kDefaultTimeout{10};

struct SessionConfig {
  std::string host;
  std::string port;
  Mode mode = Mode::fast;
  std::string banner{kDefaultBanner};
  std::string successPrefix{kSuccessPrefix};
  std::string errorPrefix{kErrorPrefix};
  std::chrono::seconds timeout = kDefaultTimeout;

  std::string Peer() const { return host + ":" + port; }
};

// Everything one replay run needs: what to send, where, and where to log.
struct RunOptions {
  std::string directory;
  SessionConfig session;
  std::string extension = ".xml";
  std::string logDir = ".";
};
