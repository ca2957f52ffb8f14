#pragma once

#include <charconv>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "core/config.hpp"

namespace cli {

struct ParsedArgs {
  RunOptions run;
  bool help = false;
};

inline constexpr const char *kUsage =
    "usage: clusterd_tester <directory> <server_ip> <server_port> [options]\n"
    "\n"
    "Test a daemon service by replaying a directory of files.\n"
    "\n"
    "options:\n"
    "  -m, --mode fast|detailed  fast: statistics only (default);\n"
    "                            detailed: also log every file and reply\n"
    "  -b, --banner TEXT         expected banner (default \"+RCLUSTER Version "
    "v1.10\")\n"
    "  -e, --ext EXT             file extension to replay (default .xml)\n"
    "  -t, --timeout SECONDS     socket timeout (default 10)\n"
    "  -l, --log-dir DIR         directory for the log file (default .)\n"
    "  -h, --help                show this help\n";

inline bool ParseInt(std::string_view s, int &out) {
  const char *first = s.data();
  const char *last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

// Parses argv into run options. Returns an error message on invalid input.
inline std::expected<ParsedArgs, std::string> ParseArgs(int argc,
                                                        char **argv) {
  ParsedArgs out;
  std::string positional[3];
  int npos = 0;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto needValue = [&]() -> bool { return i + 1 < argc; };
    if (a == "-h" || a == "--help") {
      out.help = true;
      return out;
    } else if (a == "-m" || a == "--mode") {
      if (!needValue()) {
        return std::unexpected("missing value for " + a);
      }
      auto mode = ParseMode(argv[++i]);
      if (!mode) {
        return std::unexpected(std::string("invalid mode '") + argv[i] +
                               "' (choose fast or detailed)");
      }
      out.run.session.mode = *mode;
    } else if (a == "-b" || a == "--banner") {
      if (!needValue()) {
        return std::unexpected("missing value for " + a);
      }
      out.run.session.banner = argv[++i];
    } else if (a == "-e" || a == "--ext") {
      if (!needValue()) {
        return std::unexpected("missing value for " + a);
      }
      out.run.extension = argv[++i];
    } else if (a == "-t" || a == "--timeout") {
      int seconds = 0;
      if (!needValue() || !ParseInt(argv[i + 1], seconds) || seconds <= 0) {
        return std::unexpected(a + " expects a positive number of seconds");
      }
      ++i;
      out.run.session.timeout = std::chrono::seconds(seconds);
    } else if (a == "-l" || a == "--log-dir") {
      if (!needValue()) {
        return std::unexpected("missing value for " + a);
      }
      out.run.logDir = argv[++i];
    } else if (a.size() > 1 && a[0] == '-') {
      return std::unexpected("unknown option: " + a);
    } else if (npos < 3) {
      positional[npos++] = a;
    } else {
      return std::unexpected("unexpected argument: " + a);
    }
  }
  if (npos < 3) {
    return std::unexpected(std::string(
        "expected <directory> <server_ip> <server_port>"));
  }
  int port = 0;
  if (!ParseInt(positional[2], port) || port < 1 || port > 65535) {
    return std::unexpected("invalid server_port: " + positional[2]);
  }
  out.run.directory = positional[0];
  out.run.session.host = positional[1];
  out.run.session.port = std::to_string(port);
  return out;
}

} // namespace cli
