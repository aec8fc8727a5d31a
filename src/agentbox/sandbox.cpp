#include <agentbox/sandbox.h>

#include <spdlog/spdlog.h>
#include <agentbox/errors.h>
#include <agentbox/retention.h>
#include <agentbox/run_session.h>
#include "utils.h"

SandboxContext::SandboxContext(SandboxConfig config, std::unique_ptr<CommandRunner> runner) :
    config_(std::move(config)),
    runner_(std::move(runner)),
    runtime_(config_.runtime, *runner_, cache_) {}

ExecutionResult SandboxContext::Execute(const std::string& code, const Namespace& ns) {
  if (!CreateDirs(config_.generated_root)) {
    throw SessionCreateError("cannot create " + config_.generated_root.string());
  }
  // runs on every exit path, including failures to create or populate the session
  ScopeGuard prune([this]() {
    PruneRunDirectories(config_.generated_root, config_.max_sessions);
  });
  RunSession session = RunSession::Create(config_.generated_root);
  spdlog::info("Run {}: {} bytes of code, {} variables offered", session.RunId(), code.size(), ns.size());
  session.Populate(code, ns);
  session.Execute(runtime_, config_);
  ExecutionResult result = session.Collect();
  spdlog::info("Run {} finished with exit code {}", session.RunId(), result.exit_code);
  return result;
}
