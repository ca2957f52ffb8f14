#pragma once

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "core/error.hpp"

namespace io {

// Reads the whole file in binary mode.
inline Result<std::string> ReadWholeFile(const std::filesystem::path &path) {
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const std::string reason =
        errno != 0 ? std::generic_category().message(errno) : "cannot open file";
    return MakeError(ErrorKind::file_unreadable, reason,
                     "Cannot read " + path.string() + ": " + reason);
  }
  std::string data{std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return MakeError(ErrorKind::file_unreadable, "read error",
                     "Cannot read " + path.string() + ": read error");
  }
  return data;
}

} // namespace io
