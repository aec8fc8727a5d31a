#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <agentbox/container_runtime.h>

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
  fs::path path_;
 public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  const fs::path& path() const { return path_; }
};

// CommandRunner that records every invocation instead of starting processes.
// Everything succeeds with empty output unless handler says otherwise.
class FakeBackend : public CommandRunner {
 public:
  using Handler = std::function<CommandResult(const std::vector<std::string>&)>;

  std::vector<std::vector<std::string>> calls;
  std::vector<std::vector<std::string>> spawned;
  Handler handler;
  bool spawn_ok = true;
  std::function<void()> on_spawn;

  CommandResult Run(const std::vector<std::string>& argv) override;
  bool SpawnDetached(const std::vector<std::string>& argv, const fs::path& log_file) override;

  // number of recorded calls whose argv contains all of words
  size_t Count(const std::vector<std::string>& words) const;
};

CommandResult MakeResult(int exit_code, const std::string& out = "", const std::string& err = "");

// options pointing the daemon socket at an existing file, so no daemon is ever needed
RuntimeOptions FakeRuntimeOptions(const fs::path& scratch);

// first argument following flag in argv, or "" if absent
std::string ArgAfter(const std::vector<std::string>& argv, const std::string& flag);

#endif // TEST_UTILS_H_
