#pragma once

#include "core/config.hpp"
#include "core/stats.hpp"
#include "logging/log_record.hpp"
#include "logging/logger.hpp"
#include "net/tcp_transport.hpp"
#include "sessions/replay_session.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

// Runner composition/threading overview:
// - FileLogger: dedicated jthread; drains the log SPSC queue with writev
// - ReplaySession: runs on the calling thread; blocking I/O over one
//   TcpTransport, producer to the FileLogger through logging::Logger
// - Calling thread: replays the directory, logs the summary, joins the logger

inline std::string LogFilePath(const std::string &logDir) {
  const std::string name =
      "clusterd-log-" + timeutil::TimestampForFile() + ".log";
  return (std::filesystem::path(logDir) / name).string();
}

// Replays one directory with the given logger and transport factory.
// Returns 0 when the run completes, 1 on a fatal connect/handshake failure.
inline int ReplayDirectory(const RunOptions &opt, TransportFactory factory,
                           logging::Logger &log) {
  ReplaySession session(opt.session, std::move(factory), log);
  auto outcomes = session.Replay(opt.directory, opt.extension);
  if (!outcomes) {
    log.Error("Initial connection failed: " + outcomes.error().message);
    return 1;
  }
  for (const auto &line : FormatSummary(Summarize(*outcomes))) {
    log.Info(line);
  }
  return 0;
}

inline int Run(const RunOptions &opt, std::ostream &console = std::cerr) {
  auto queue = std::make_shared<logging::LogQueue>();
  logging::FileLogger fileLogger;
  const std::string path = LogFilePath(opt.logDir);
  if (!fileLogger.Open(queue, path)) {
    console << "Cannot open log file " << path << "\n";
    return 1;
  }
  fileLogger.Start();
  logging::Logger log(queue, console);

  int rc = ReplayDirectory(
      opt, [] { return std::make_unique<TcpTransport>(); }, log);

  fileLogger.Join();
  return rc;
}
