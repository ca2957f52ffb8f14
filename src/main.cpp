#include "cli/options.hpp"
#include "core/runner.hpp"
#include <iostream>

int main(int argc, char **argv) {
  auto args = cli::ParseArgs(argc, argv);
  if (!args) {
    std::cerr << "clusterd_tester: " << args.error() << "\n\n" << cli::kUsage;
    return 2;
  }
  if (args->help) {
    std::cout << cli::kUsage;
    return 0;
  }

  const auto &opt = args->run;
  std::cout << "Replaying '" << opt.directory << "' (*" << opt.extension
            << ") to " << opt.session.Peer() << " in "
            << ToString(opt.session.mode) << " mode\n";
  return Run(opt);
}
