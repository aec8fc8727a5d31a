#ifndef INCLUDE_AGENTBOX_ERRORS_H_
#define INCLUDE_AGENTBOX_ERRORS_H_

#include <string>
#include <vector>
#include <stdexcept>

// Failures of the sandbox infrastructure. Failures of the sandboxed code itself
// are not errors; they are reported through ExecutionResult.
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// container daemon unreachable and could not be started
class DaemonUnavailableError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};
using DaemonStartError = DaemonUnavailableError;

class ImageBuildError : public SandboxError {
  std::vector<std::string> command_;
  int exit_code_;
  std::string stdout_, stderr_;
 public:
  ImageBuildError(std::vector<std::string> command, int exit_code,
                  std::string stdout_text, std::string stderr_text);

  const std::vector<std::string>& command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string& stdout_text() const { return stdout_; }
  const std::string& stderr_text() const { return stderr_; }
};

// run directory collided or could not be created
class SessionCreateError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};

class MarshalError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};

#endif  // INCLUDE_AGENTBOX_ERRORS_H_
