#ifndef INCLUDE_AGENTBOX_RUN_SESSION_H_
#define INCLUDE_AGENTBOX_RUN_SESSION_H_

#include <chrono>
#include <string>
#include <filesystem>

#include "config.h"
#include "variable.h"
#include "container_runtime.h"

#define ENUM_SESSION_STATUS_ \
  X(CREATED) \
  X(INPUTS_POPULATED) \
  X(EXECUTED) \
  X(COLLECTED) \
  X(FAILED) // execution raised; terminal
enum class SessionStatus {
#define X(name) name,
  ENUM_SESSION_STATUS_
#undef X
};

// One execution attempt. Transitions only move forward; a failed session is
// never retried, the caller creates a new one instead.
// Operations called in the wrong state throw std::logic_error.
class RunSession {
  std::string run_id_;
  std::filesystem::path root_;
  SessionStatus status_;
  ExecutionResult result_;

  RunSession(std::string run_id, std::filesystem::path root) :
      run_id_(std::move(run_id)), root_(std::move(root)), status_(SessionStatus::CREATED) {}
 public:
  // throws SessionCreateError if the directory already exists or cannot be created
  static RunSession Create(const std::filesystem::path& generated_root,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  // throws MarshalError, SandboxError
  void Populate(const std::string& code, const Namespace& ns);
  // throws DaemonUnavailableError, ImageBuildError
  void Execute(ContainerRuntime& runtime, const SandboxConfig& config);
  const ExecutionResult& Collect();

  const std::string& RunId() const { return run_id_; }
  const std::filesystem::path& Root() const { return root_; }
  std::filesystem::path Inputs() const;
  std::filesystem::path Outputs() const;
  SessionStatus Status() const { return status_; }
};

#endif  // INCLUDE_AGENTBOX_RUN_SESSION_H_
