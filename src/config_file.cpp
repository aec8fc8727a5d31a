#include "config_file.h"

#include <fstream>
#include <sstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <agentbox/paths.h>

namespace {

std::vector<std::string> SplitWords(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string word; sin >> word;) ret.push_back(word);
  return ret;
}

} // namespace

bool LoadConfigFile(const fs::path& conf_path, SandboxConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;

  std::string state_root = ini[""]["state_root"] | "";
  if (state_root.size()) {
    kStateRoot = state_root;
    config.generated_root = GeneratedRoot();
  }
  config.image = ini[""]["image"] | config.image;
  config.max_sessions = ini[""]["max_sessions"] | (long)config.max_sessions;

  RuntimeOptions& opt = config.runtime;
  opt.backend = ini[""]["backend"] | opt.backend;
  opt.daemon = ini[""]["daemon"] | opt.daemon;
  std::string daemon_socket = ini[""]["daemon_socket"] | "";
  if (daemon_socket.size()) opt.daemon_socket = daemon_socket;
  std::string daemon_log = ini[""]["daemon_log"] | "";
  if (daemon_log.size()) opt.daemon_log = daemon_log;
  opt.daemon_poll_count = ini[""]["daemon_poll_count"] | opt.daemon_poll_count;
  opt.daemon_poll_interval = std::chrono::milliseconds(
      ini[""]["daemon_poll_interval_ms"] | (long)opt.daemon_poll_interval.count());
  // "none" clears the wrapper
  std::string shell_wrapper = ini[""]["shell_wrapper"] | "";
  if (shell_wrapper == "none") {
    opt.shell_wrapper.clear();
  } else if (shell_wrapper.size()) {
    opt.shell_wrapper = SplitWords(shell_wrapper);
  }
  opt.convert_drive_paths = ini[""]["convert_drive_paths"] | opt.convert_drive_paths;
  opt.disable_network = !(ini[""]["network"] | !opt.disable_network);
  spdlog::debug("Loaded configuration from {}", conf_path.c_str());
  return true;
}
