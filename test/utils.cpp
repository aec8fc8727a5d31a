#include "utils.h"

#include <unistd.h>
#include <atomic>
#include <algorithm>
#include <fstream>

namespace {

std::atomic_int temp_dir_seq = 0;

} // namespace

TempDir::TempDir() :
    path_(fs::temp_directory_path() /
          ("agentbox-test-" + std::to_string(getpid()) + "-" + std::to_string(++temp_dir_seq))) {
  fs::remove_all(path_);
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

CommandResult FakeBackend::Run(const std::vector<std::string>& argv) {
  calls.push_back(argv);
  CommandResult ret = handler ? handler(argv) : MakeResult(0);
  ret.command = argv;
  return ret;
}

bool FakeBackend::SpawnDetached(const std::vector<std::string>& argv, const fs::path&) {
  spawned.push_back(argv);
  if (spawn_ok && on_spawn) on_spawn();
  return spawn_ok;
}

size_t FakeBackend::Count(const std::vector<std::string>& words) const {
  return std::count_if(calls.begin(), calls.end(), [&](const std::vector<std::string>& argv) {
    for (auto& word : words) {
      if (std::find(argv.begin(), argv.end(), word) == argv.end()) return false;
    }
    return true;
  });
}

CommandResult MakeResult(int exit_code, const std::string& out, const std::string& err) {
  CommandResult ret;
  ret.exit_code = exit_code;
  ret.stdout_text = out;
  ret.stderr_text = err;
  return ret;
}

RuntimeOptions FakeRuntimeOptions(const fs::path& scratch) {
  RuntimeOptions opt;
  opt.daemon_socket = scratch / "docker.sock";
  opt.daemon_log = scratch / "dockerd.log";
  opt.daemon_poll_count = 3;
  opt.daemon_poll_interval = std::chrono::milliseconds(1);
  opt.shell_wrapper.clear();
  opt.convert_drive_paths = false;
  std::ofstream(opt.daemon_socket).put('\n');
  return opt;
}

std::string ArgAfter(const std::vector<std::string>& argv, const std::string& flag) {
  auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || it + 1 == argv.end()) return "";
  return *(it + 1);
}
