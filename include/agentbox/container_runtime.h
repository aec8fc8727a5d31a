#ifndef INCLUDE_AGENTBOX_CONTAINER_RUNTIME_H_
#define INCLUDE_AGENTBOX_CONTAINER_RUNTIME_H_

#include <mutex>
#include <string>
#include <vector>
#include <filesystem>
#include <unordered_set>

#include <nlohmann/json_fwd.hpp>
#include "config.h"

struct CommandResult {
  std::vector<std::string> command;
  int exit_code; // 128+signal if killed, 127 if it could not be executed
  std::string stdout_text, stderr_text;

  CommandResult() : exit_code(-1) {}
};

class CommandRunner {
 public:
  virtual ~CommandRunner() = default;
  // blocks until the command exits; stdin is /dev/null
  virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
  // start a daemon in its own session with stdout/stderr sent to log_file
  // returns false if it could not be spawned
  virtual bool SpawnDetached(const std::vector<std::string>& argv,
                             const std::filesystem::path& log_file) = 0;
};

class SystemCommandRunner : public CommandRunner {
 public:
  CommandResult Run(const std::vector<std::string>& argv) override;
  bool SpawnDetached(const std::vector<std::string>& argv,
                     const std::filesystem::path& log_file) override;
};

class ExecutionResult {
 public:
  std::string stdout_text, stderr_text;
  int exit_code;

  ExecutionResult() : exit_code(0) {}
  ExecutionResult(std::string out, std::string err, int exit_code) :
      stdout_text(std::move(out)), stderr_text(std::move(err)), exit_code(exit_code) {}
  bool Success() const { return exit_code == 0; }
  nlohmann::json ToJson() const;
};

// Images last seen to exist, plus usage counters. Shared by every session of one context.
class ImageCache {
  mutable std::mutex mtx_;
  std::unordered_set<std::string> ready_;
  long builds_, probes_, runs_;
 public:
  ImageCache() : builds_(0), probes_(0), runs_(0) {}

  bool IsReady(const std::string& image) const;
  void MarkReady(const std::string& image);
  void Invalidate(const std::string& image);

  void RecordBuild();
  void RecordProbe();
  void RecordRun();
  long Builds() const;
  long Probes() const;
  long Runs() const;
};

class ContainerRuntime {
  RuntimeOptions opt_;
  CommandRunner& runner_;
  ImageCache& cache_;

  std::vector<std::string> Wrap_(std::vector<std::string> argv) const;
  CommandResult Invoke_(const std::vector<std::string>& argv);
 public:
  ContainerRuntime(RuntimeOptions opt, CommandRunner& runner, ImageCache& cache) :
      opt_(std::move(opt)), runner_(runner), cache_(cache) {}

  // throws DaemonUnavailableError
  void EnsureDaemonRunning();
  bool ImageExists(const std::string& image);
  // throws ImageBuildError, DaemonUnavailableError
  void EnsureImage(const std::string& image);
  // exit status of the sandboxed code is data, not an exception
  ExecutionResult Run(const std::string& image,
                      const std::filesystem::path& inputs_dir,
                      const std::filesystem::path& outputs_dir);

  std::vector<std::string> RunCommandLine(const std::string& image,
                                          const std::filesystem::path& inputs_dir,
                                          const std::filesystem::path& outputs_dir) const;
  // path syntax expected by the backend (after the shell wrapper, if any)
  std::string ToBackendPath(const std::filesystem::path&) const;
  const RuntimeOptions& Options() const { return opt_; }
};

#endif  // INCLUDE_AGENTBOX_CONTAINER_RUNTIME_H_
