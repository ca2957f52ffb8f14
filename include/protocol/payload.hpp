#pragma once

#include <string>
#include <string_view>

#include "core/error.hpp"
#include "net/transport.hpp"

namespace proto {

// Fixed marker sent in front of every payload. Not negotiated, no length
// prefix and no terminator follow it.
inline constexpr std::string_view kPayloadMarker = "BUF";

inline std::string BuildPayload(std::string_view contents) {
  std::string wire;
  wire.reserve(kPayloadMarker.size() + contents.size());
  wire.append(kPayloadMarker);
  wire.append(contents);
  return wire;
}

// Marker and contents go out as a single write.
inline Status SendPayload(ITransport &transport, std::string_view contents) {
  return transport.SendAll(BuildPayload(contents));
}

} // namespace proto
