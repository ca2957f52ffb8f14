#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "net/transport.hpp"
#include "sessions/replay_session.hpp"

namespace testing_support {

// Shared record of what the session did with every transport it created.
// Replies are handed out in order: the banner first, then one per file.
struct FakeScript {
  std::optional<Error> connectError;
  std::optional<Error> sendError;
  std::deque<Result<std::string>> replies;

  std::vector<std::string> sent;
  int transportsCreated = 0;
  int connects = 0;
  int receives = 0;
  int closes = 0;

  void Reply(std::string text) { replies.emplace_back(std::move(text)); }
};

class FakeTransport : public ITransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeScript> script)
      : script_(std::move(script)) {}

  ~FakeTransport() override { Close(); }

  Status Connect(const std::string &, const std::string &,
                 std::chrono::seconds) override {
    ++script_->connects;
    if (script_->connectError) {
      return std::unexpected(*script_->connectError);
    }
    open_ = true;
    return {};
  }

  Status SendAll(std::string_view bytes) override {
    if (script_->sendError) {
      return std::unexpected(*script_->sendError);
    }
    script_->sent.emplace_back(bytes);
    return {};
  }

  Result<std::string> Receive(std::size_t) override {
    ++script_->receives;
    if (script_->replies.empty()) {
      return MakeError(ErrorKind::connection_failure,
                       "connection closed by peer",
                       "Connection to fake closed by peer");
    }
    auto r = std::move(script_->replies.front());
    script_->replies.pop_front();
    return r;
  }

  void Close() override {
    if (open_) {
      open_ = false;
      ++script_->closes;
    }
  }

private:
  std::shared_ptr<FakeScript> script_;
  bool open_ = false;
};

inline TransportFactory MakeFakeFactory(std::shared_ptr<FakeScript> script) {
  return [script] {
    ++script->transportsCreated;
    return std::make_unique<FakeTransport>(script);
  };
}

} // namespace testing_support
