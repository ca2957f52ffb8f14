#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace proto {

// ClassifyResponse: interprets the reply to one payload.
// - success prefix: success, whatever follows
// - error prefix: server_rejected; detail is everything after the prefix and
//   the one separator character that follows it
// - anything else: protocol_violation carrying the raw reply
// The success prefix is checked first. `subject` names the file in messages.
inline Status ClassifyResponse(std::string_view reply,
                               std::string_view successPrefix,
                               std::string_view errorPrefix,
                               std::string_view subject) {
  if (boost::algorithm::starts_with(reply, successPrefix)) {
    return {};
  }
  if (boost::algorithm::starts_with(reply, errorPrefix)) {
    const std::size_t skip = errorPrefix.size() + 1;
    std::string detail =
        reply.size() > skip ? std::string(reply.substr(skip)) : std::string();
    std::string message =
        "Failure for " + std::string(subject) + ": " + detail;
    return MakeError(ErrorKind::server_rejected, std::move(detail),
                     std::move(message));
  }
  return MakeError(ErrorKind::protocol_violation, std::string(reply),
                   "Unexpected response for " + std::string(subject) + ": " +
                       std::string(reply));
}

} // namespace proto
