#pragma once

#include <string>
#include <string_view>

#include "core/error.hpp"

namespace proto {

// The banner must match byte for byte: no trimming, no prefix match.
inline Status ValidateBanner(std::string_view received,
                             std::string_view expected,
                             std::string_view peer) {
  if (received != expected) {
    return MakeError(ErrorKind::no_acknowledgment, std::string(received),
                     "No acknowledgment from " + std::string(peer) + ": " +
                         std::string(received));
  }
  return {};
}

} // namespace proto
