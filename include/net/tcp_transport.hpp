#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "core/error.hpp"
#include "net/transport.hpp"
#include "util/utf8.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

// TcpTransport
// Threading model:
// - Owns a private io_context that only the calling thread runs
// - Each call starts one async operation on a beast::tcp_stream and runs the
//   io_context until that operation completes, so callers see blocking I/O
//   while the stream's expiry bounds every call by the connect timeout
// - Beast closes the socket when an operation times out; later calls on the
//   same transport then fail as well
class TcpTransport : public ITransport {
public:
  TcpTransport() : stream_(ioc_) {}
  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  ~TcpTransport() override { Close(); }

  Status Connect(const std::string &host, const std::string &port,
                 std::chrono::seconds timeout) override {
    timeout_ = timeout;
    peer_ = host + ":" + port;

    tcp::resolver resolver(ioc_);
    beast::error_code ec;
    auto endpoints = resolver.resolve(host, port, ec);
    if (ec) {
      return ConnectFailure(ec);
    }

    std::optional<beast::error_code> result;
    stream_.expires_after(timeout_);
    stream_.async_connect(endpoints,
                          [&result](const beast::error_code &e,
                                    const tcp::endpoint &) { result = e; });
    ec = RunUntilComplete(result);
    if (ec) {
      return ConnectFailure(ec);
    }
    connected_ = true;
    return {};
  }

  Status SendAll(std::string_view bytes) override {
    if (!connected_) {
      return NotConnected("Send");
    }
    std::optional<beast::error_code> result;
    stream_.expires_after(timeout_);
    net::async_write(stream_, net::buffer(bytes.data(), bytes.size()),
                     [&result](const beast::error_code &e, std::size_t) {
                       result = e;
                     });
    const beast::error_code ec = RunUntilComplete(result);
    if (ec) {
      return TransferFailure("Send to", ec);
    }
    return {};
  }

  Result<std::string> Receive(std::size_t maxBytes) override {
    if (!connected_) {
      return NotConnected("Receive");
    }
    std::string buf(maxBytes, '\0');
    std::size_t nread = 0;
    std::optional<beast::error_code> result;
    stream_.expires_after(timeout_);
    stream_.async_read_some(
        net::buffer(buf.data(), buf.size()),
        [&result, &nread](const beast::error_code &e, std::size_t n) {
          result = e;
          nread = n;
        });
    const beast::error_code ec = RunUntilComplete(result);
    if (ec == net::error::eof) {
      return MakeError(ErrorKind::connection_failure,
                       "connection closed by peer",
                       "Connection to " + peer_ + " closed by peer");
    }
    if (ec) {
      return TransferFailure("Receive from", ec);
    }
    buf.resize(nread);
    if (!utf8::IsValid(buf)) {
      return MakeError(ErrorKind::protocol_violation, buf,
                       "Received non UTF-8 data from " + peer_);
    }
    return buf;
  }

  void Close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    connected_ = false;
    stream_.close();
  }

private:
  beast::error_code
  RunUntilComplete(const std::optional<beast::error_code> &result) {
    ioc_.restart();
    while (!result.has_value()) {
      if (ioc_.run_one() == 0) {
        return net::error::operation_aborted;
      }
    }
    return *result;
  }

  std::unexpected<Error> ConnectFailure(const beast::error_code &ec) const {
    return MakeError(ErrorKind::connection_failure, ec.message(),
                     "Failed to connect to " + peer_ + ": " + ec.message());
  }

  std::unexpected<Error> TransferFailure(const char *stage,
                                         const beast::error_code &ec) const {
    return MakeError(ErrorKind::connection_failure, ec.message(),
                     std::string(stage) + " " + peer_ + " failed: " +
                         ec.message());
  }

  std::unexpected<Error> NotConnected(const char *stage) const {
    return MakeError(ErrorKind::connection_failure, "not connected",
                     std::string(stage) + " on a closed connection");
  }

  net::io_context ioc_;
  beast::tcp_stream stream_;
  std::chrono::seconds timeout_{10};
  std::string peer_;
  bool connected_ = false;
  bool closed_ = false;
};
