#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

// namespace utf8: strict UTF-8 validation for text received off the wire.
// Rejects overlong encodings, surrogates and code points above U+10FFFF.
namespace utf8 {

inline bool IsValid(std::string_view sv) {
  const auto *p = reinterpret_cast<const std::uint8_t *>(sv.data());
  const std::size_t n = sv.size();
  std::size_t i = 0;
  while (i < n) {
    const std::uint8_t c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0) {
        lo = 0xA0;
      } else if (c == 0xED) {
        hi = 0x9F;
      }
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0) {
        lo = 0x90;
      } else if (c == 0xF4) {
        hi = 0x8F;
      }
    } else {
      return false;
    }
    if (n - i < len) {
      return false;
    }
    // only the first continuation byte has a narrowed range
    if (p[i + 1] < lo || p[i + 1] > hi) {
      return false;
    }
    for (std::size_t k = 2; k < len; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

} // namespace utf8
