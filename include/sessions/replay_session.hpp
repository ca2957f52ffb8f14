#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/stats.hpp"
#include "io/file_discovery.hpp"
#include "io/file_reader.hpp"
#include "logging/logger.hpp"
#include "net/transport.hpp"
#include "protocol/handshake.hpp"
#include "protocol/payload.hpp"
#include "protocol/response.hpp"
#include "util/latency.hpp"

enum class SessionState {
  unconnected,
  handshaking,
  ready,
  sending,
  awaiting_response,
  closed
};

using TransportFactory = std::function<TransportPtr()>;

// ReplaySession
// Threading model:
// - Single-threaded and strictly sequential: one connection, one file in
//   flight, no overlapping I/O
// - Owns the connection exclusively; it is held only between a successful
//   handshake and Close()
// Error handling:
// - Connect and handshake failures are returned to the caller and end the
//   run before any file is sent
// - Everything that goes wrong while exchanging one file is logged and
//   recorded in that file's outcome; the loop moves on to the next file
class ReplaySession {
public:
  ReplaySession(SessionConfig config, TransportFactory factory,
                logging::Logger &log)
      : config_(std::move(config)), factory_(std::move(factory)), log_(log) {}

  ReplaySession(const ReplaySession &) = delete;
  ReplaySession &operator=(const ReplaySession &) = delete;

  ~ReplaySession() { Close(); }

  SessionState State() const { return state_; }
  bool Connected() const { return connection_ != nullptr; }

  // Connects and validates the banner. No-op while a validated connection is
  // held, so a caller may connect up front and replay later.
  Status EnsureConnected() {
    if (connection_) {
      return {};
    }
    state_ = SessionState::handshaking;
    TransportPtr transport = factory_();
    if (auto st =
            transport->Connect(config_.host, config_.port, config_.timeout);
        !st) {
      return Abort(*transport, st.error());
    }
    auto banner = transport->Receive(kReceiveBufferSize);
    if (!banner) {
      Error e = banner.error();
      if (e.kind == ErrorKind::protocol_violation) {
        // undecodable banner reply: no acknowledgment, whatever --banner holds
        e = Error{.kind = ErrorKind::no_acknowledgment,
                  .detail = e.detail,
                  .message = "No acknowledgment from " + config_.Peer() +
                             ": " + e.detail};
      }
      return Abort(*transport, e);
    }
    if (auto st = proto::ValidateBanner(*banner, config_.banner,
                                        config_.Peer());
        !st) {
      return Abort(*transport, st.error());
    }
    connection_ = std::move(transport);
    state_ = SessionState::ready;
    return {};
  }

  // Sends one file over the held connection and classifies the reply. Never
  // fails the run: the returned outcome says what happened.
  TransferOutcome SendFile(const std::filesystem::path &file) {
    lat::Stopwatch watch;
    Status st = ExchangeFile(file);
    TransferOutcome out{.file = file,
                        .seconds = watch.ElapsedSeconds(),
                        .success = st.has_value(),
                        .error = std::nullopt};
    if (!st) {
      log_.Error(st.error().message);
      out.error = std::move(st.error());
    }
    return out;
  }

  // Connects if needed, sends every file in the given order, then closes the
  // connection.
  Result<std::vector<TransferOutcome>>
  ReplayFiles(const std::vector<std::filesystem::path> &files) {
    if (auto st = EnsureConnected(); !st) {
      return std::unexpected(st.error());
    }
    std::vector<TransferOutcome> outcomes;
    outcomes.reserve(files.size());
    for (const auto &file : files) {
      if (config_.mode == Mode::detailed) {
        log_.Info("Sending " + file.string() + " to " + config_.Peer());
      }
      outcomes.push_back(SendFile(file));
    }
    Close();
    return outcomes;
  }

  // Connects first, then replays every file in `dir` ending with `extension`.
  Result<std::vector<TransferOutcome>>
  Replay(const std::filesystem::path &dir, const std::string &extension) {
    if (auto st = EnsureConnected(); !st) {
      return std::unexpected(st.error());
    }
    auto found = io::ListFilesWithExtension(dir, extension);
    if (found.ec) {
      log_.Error("Cannot list " + dir.string() + ": " + found.ec.message());
    }
    return ReplayFiles(found.files);
  }

  void Close() {
    if (connection_) {
      connection_->Close();
      connection_.reset();
    }
    if (state_ != SessionState::unconnected) {
      state_ = SessionState::closed;
    }
  }

private:
  Status ExchangeFile(const std::filesystem::path &file) {
    if (!connection_) {
      return MakeError(ErrorKind::connection_failure, "not connected",
                       "Cannot send " + file.string() + ": not connected");
    }
    state_ = SessionState::sending;
    Status st = SendAndClassify(file);
    state_ = SessionState::ready;
    return st;
  }

  Status SendAndClassify(const std::filesystem::path &file) {
    auto contents = io::ReadWholeFile(file);
    if (!contents) {
      return std::unexpected(contents.error());
    }
    if (auto st = proto::SendPayload(*connection_, *contents); !st) {
      return TransferError(file, st.error());
    }
    state_ = SessionState::awaiting_response;
    auto reply = connection_->Receive(kReceiveBufferSize);
    if (!reply) {
      return TransferError(file, reply.error());
    }
    if (auto st = proto::ClassifyResponse(*reply, config_.successPrefix,
                                          config_.errorPrefix, file.string());
        !st) {
      return st;
    }
    if (config_.mode == Mode::detailed) {
      log_.Info("Success for " + file.string() + ": " + *reply);
    }
    return {};
  }

  static std::unexpected<Error>
  TransferError(const std::filesystem::path &file, Error e) {
    e.message = "Transfer of " + file.string() + " failed: " + e.message;
    return std::unexpected(std::move(e));
  }

  Status Abort(ITransport &transport, const Error &e) {
    transport.Close();
    state_ = SessionState::closed;
    return std::unexpected(e);
  }

  SessionConfig config_;
  TransportFactory factory_;
  logging::Logger &log_;
  TransportPtr connection_;
  SessionState state_ = SessionState::unconnected;
};
