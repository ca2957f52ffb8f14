#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

// Error kinds reported by the replay pipeline.
// - connection_failure: any socket-level failure (resolve, connect, send,
//   receive, timeout, peer close)
// - no_acknowledgment: the banner received on connect did not match
// - server_rejected: the server answered with the error prefix
// - protocol_violation: the reply matched neither prefix or was not UTF-8
// - file_unreadable: the payload file could not be read
enum class ErrorKind {
  connection_failure,
  no_acknowledgment,
  server_rejected,
  protocol_violation,
  file_unreadable
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::connection_failure:
    return "connection_failure";
  case ErrorKind::no_acknowledgment:
    return "no_acknowledgment";
  case ErrorKind::server_rejected:
    return "server_rejected";
  case ErrorKind::protocol_violation:
    return "protocol_violation";
  case ErrorKind::file_unreadable:
    return "file_unreadable";
  }
  return "unknown";
}

struct Error {
  ErrorKind kind;
  // Raw payload of the failure: server detail, raw reply, received banner or
  // OS error text.
  std::string detail;
  std::string message;
};

using Status = std::expected<void, Error>;

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> MakeError(ErrorKind kind, std::string detail,
                                        std::string message) {
  return std::unexpected(Error{.kind = kind,
                               .detail = std::move(detail),
                               .message = std::move(message)});
}
