#ifndef INCLUDE_AGENTBOX_SANDBOX_H_
#define INCLUDE_AGENTBOX_SANDBOX_H_

#include <memory>
#include <string>

#include "config.h"
#include "variable.h"
#include "container_runtime.h"

// Owns everything that outlives a single run: configuration, the process
// runner, the image cache and the container runtime. Construct one per process
// (or per caller) and pass it around; there is no global instance.
class SandboxContext {
  SandboxConfig config_;
  std::unique_ptr<CommandRunner> runner_;
  ImageCache cache_;
  ContainerRuntime runtime_;
 public:
  explicit SandboxContext(SandboxConfig config,
                          std::unique_ptr<CommandRunner> runner = std::make_unique<SystemCommandRunner>());
  SandboxContext(const SandboxContext&) = delete;
  SandboxContext& operator=(const SandboxContext&) = delete;

  // create -> populate -> execute -> collect in a fresh run directory
  // old run directories are pruned afterwards on every exit path
  // infrastructure failures throw; failures of the code are in the result
  ExecutionResult Execute(const std::string& code, const Namespace& ns = {});

  const SandboxConfig& Config() const { return config_; }
  ContainerRuntime& Runtime() { return runtime_; }
  ImageCache& Cache() { return cache_; }
};

#endif  // INCLUDE_AGENTBOX_SANDBOX_H_
