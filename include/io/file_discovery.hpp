#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace io {

struct DiscoveryResult {
  std::vector<std::filesystem::path> files;
  std::error_code ec; // set when the directory could not be listed
};

// Lists regular files directly inside `dir` whose name ends with `extension`
// (e.g. ".xml"). Entries come back in directory iteration order; nothing is
// sorted. An empty extension matches every regular file.
inline DiscoveryResult ListFilesWithExtension(const std::filesystem::path &dir,
                                              const std::string &extension) {
  namespace fs = std::filesystem;
  DiscoveryResult out;
  fs::directory_iterator it(dir, out.ec);
  if (out.ec) {
    return out;
  }
  for (const fs::directory_iterator end; it != end; it.increment(out.ec)) {
    if (out.ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (!boost::algorithm::ends_with(name, extension)) {
      continue;
    }
    out.files.push_back(it->path());
  }
  return out;
}

} // namespace io
