#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "core/error.hpp"

inline constexpr std::size_t kReceiveBufferSize = 1024;

// ITransport: one stream connection to the server.
// Lets the session run over the real TCP transport or over a scripted
// in-memory one without knowing the concrete type.
// - Connect: the timeout applies to the connect and to every later call
// - SendAll: all bytes go or the call fails
// - Receive: at most maxBytes, returned as validated UTF-8 text
// - Close: idempotent; the destructor closes as well
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual Status Connect(const std::string &host, const std::string &port,
                         std::chrono::seconds timeout) = 0;
  virtual Status SendAll(std::string_view bytes) = 0;
  virtual Result<std::string> Receive(std::size_t maxBytes) = 0;
  virtual void Close() = 0;
};

using TransportPtr = std::unique_ptr<ITransport>;
