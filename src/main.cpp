#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <agentbox/logger.h>
#include <agentbox/paths.h>
#include "cli.h"

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  CliOptions opt;
  try {
    opt = ParseCommandLine(std::vector<std::string>(argv, argv + argc));
  } catch (const std::invalid_argument& err) {
    std::cerr << err.what();
    return 1;
  }
  switch (opt.verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  SandboxConfig config;
  if (!ResolveConfig(opt, config)) return 1;
  InitLogger(LogRoot());
  return RunCli(opt, config, std::make_unique<SystemCommandRunner>(), std::cin, std::cout, std::cerr);
}
