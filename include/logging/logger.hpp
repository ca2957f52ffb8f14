#pragma once

#include <atomic>
#include <chrono>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

#include "io/file_writer.hpp"
#include "logging/log_record.hpp"
#include "util/time.hpp"

namespace logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// FileLogger
// Threading model:
// - Single background thread drains one SPSC queue and writes batched lines
//   via writev
// - Logger (below) is the single producer; this is the single consumer
// - After Join() returns every pushed line has been written
class FileLogger : public LoggerBase<FileLogger> {
public:
  FileLogger() = default;
  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  ~FileLogger() {
    Join();
    Close();
  }

  // Opens (truncates) `path` and attaches the queue this logger drains.
  // Must be called before Start().
  bool Open(std::shared_ptr<LogQueue> queue, const std::string &path) {
    Close();
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ == -1) {
      return false;
    }
    queue_ = std::move(queue);
    return true;
  }

  bool WriteFailed() const {
    return write_failed_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    for (;;) {
      if (!this->running_.load(std::memory_order_acquire)) {
        break;
      }
      if (DrainQueue() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
    while (DrainQueue() > 0) {
    }
  }

private:
  static constexpr int kBatch = 64;

  void Close() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  std::size_t DrainQueue() {
    if (!queue_) {
      return 0;
    }
    LogRecord batch[kBatch];
    struct iovec iov[kBatch];
    std::size_t total = 0;
    int cnt = 0;
    // batch consume to reduce syscalls
    while (queue_->pop(batch[cnt])) {
      iov[cnt] = {batch[cnt].line.data(), batch[cnt].line.size()};
      ++cnt;
      ++total;
      if (cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (fd_ == -1 || WriteFailed()) {
      return;
    }
    if (!io::WritevAll(fd_, iov, cnt)) {
      write_failed_.store(true, std::memory_order_relaxed);
      std::cerr << "log file write failed; further file logging disabled\n";
    }
  }

  std::shared_ptr<LogQueue> queue_;
  int fd_ = -1;
  std::atomic<bool> write_failed_{false};
};

// Logger: formatting front end used by the replay code.
// Every line goes to the console stream immediately and, when a queue is
// attached, to the FileLogger draining it. The FileLogger must be running
// while lines are pushed, otherwise a full queue blocks the producer.
class Logger {
public:
  explicit Logger(std::ostream &console) : console_(&console) {}
  Logger(std::shared_ptr<LogQueue> queue, std::ostream &console)
      : queue_(std::move(queue)), console_(&console) {}

  void Info(std::string_view msg) { Log(Level::info, msg); }
  void Warning(std::string_view msg) { Log(Level::warning, msg); }
  void Error(std::string_view msg) { Log(Level::error, msg); }

  void Log(Level level, std::string_view msg) {
    std::string line = timeutil::LogTimestamp();
    line += " - ";
    line += ToString(level);
    line += " - ";
    line += msg;
    line += '\n';
    *console_ << line << std::flush;
    if (queue_) {
      LogRecord rec{std::move(line)};
      while (!queue_->push(rec)) {
        std::this_thread::yield();
      }
    }
  }

private:
  std::shared_ptr<LogQueue> queue_;
  std::ostream *console_;
};

} // namespace logging
