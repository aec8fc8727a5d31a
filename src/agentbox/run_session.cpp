#include <agentbox/run_session.h>

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <agentbox/errors.h>
#include <agentbox/marshal.h>
#include "paths.h"
#include "utils.h"

namespace {

void ExpectStatus(SessionStatus actual, SessionStatus expected, const char* op) {
  if (actual == expected) return;
  throw std::logic_error(std::string(op) + " called on a session in state " +
                         SessionStatusName(actual) + ", expected " + SessionStatusName(expected));
}

} // namespace

RunSession RunSession::Create(const fs::path& generated_root, std::chrono::system_clock::time_point now) {
  std::string run_id = RunDirectoryName(now);
  fs::path root = generated_root / run_id;
  if (!CreateFreshDir(root)) {
    throw SessionCreateError("cannot create run directory " + root.string());
  }
  if (!CreateDirs(RunInputsPath(root)) || !CreateDirs(RunOutputsPath(root))) {
    RemoveAll(root);
    throw SessionCreateError("cannot create inputs/outputs under " + root.string());
  }
  spdlog::debug("Created run directory {}", root.c_str());
  return RunSession(std::move(run_id), std::move(root));
}

fs::path RunSession::Inputs() const {
  return RunInputsPath(root_);
}

fs::path RunSession::Outputs() const {
  return RunOutputsPath(root_);
}

void RunSession::Populate(const std::string& code, const Namespace& ns) {
  ExpectStatus(status_, SessionStatus::CREATED, "Populate");
  try {
    if (!WriteFile(RunCodePath(root_), code)) {
      throw SandboxError("cannot write code into " + Inputs().string());
    }
    if (!Copy(BootstrapScriptPath(), RunBootstrapPath(root_))) {
      throw SandboxError("cannot install bootstrap script from " + BootstrapScriptPath().string());
    }
    MarshalVariables(code, ns, Inputs());
  } catch (...) {
    status_ = SessionStatus::FAILED;
    throw;
  }
  status_ = SessionStatus::INPUTS_POPULATED;
}

void RunSession::Execute(ContainerRuntime& runtime, const SandboxConfig& config) {
  ExpectStatus(status_, SessionStatus::INPUTS_POPULATED, "Execute");
  try {
    if (config.build_image) runtime.EnsureImage(config.image);
    result_ = runtime.Run(config.image, Inputs(), Outputs());
  } catch (...) {
    status_ = SessionStatus::FAILED;
    throw;
  }
  status_ = SessionStatus::EXECUTED;
}

const ExecutionResult& RunSession::Collect() {
  if (status_ == SessionStatus::COLLECTED) return result_;
  ExpectStatus(status_, SessionStatus::EXECUTED, "Collect");
  status_ = SessionStatus::COLLECTED;
  return result_;
}
