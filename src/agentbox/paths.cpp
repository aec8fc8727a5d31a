#include "paths.h"

#include <unistd.h>
#include <ctime>
#include <atomic>
#include <cstdlib>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <agentbox/config.h>
#include <agentbox/marshal.h>

namespace internal {
fs::path kDataDir = fs::path(AGENTBOX_DATA_DIR);
} // internal

fs::path kStateRoot = DefaultStateRoot();

const char kContainerInputs[] = "/inputs";
const char kContainerOutputs[] = "/outputs";
const char kCodeFileName[] = "code.py";
const char kBootstrapFileName[] = "bootstrap.py";
const char kLogFileName[] = "agentbox.log";

namespace {

std::atomic_long build_dir_seq = 0;

} // namespace

fs::path DefaultStateRoot() {
  if (const char* env = std::getenv(kStateRootEnv); env && *env) {
    return fs::path(env);
  }
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "agentbox";
  }
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : ".") / ".local" / "state" / "agentbox";
}

fs::path GeneratedRoot() {
  return kStateRoot / "generated";
}
fs::path LogRoot() {
  return kStateRoot / "logs";
}

std::string RunDirectoryName(std::chrono::system_clock::time_point now) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
  long micros = since_epoch.count() % 1'000'000;
  if (micros < 0) micros += 1'000'000;
  std::time_t secs = std::chrono::system_clock::to_time_t(
      now - std::chrono::microseconds(micros));
  return fmt::format("run_{:%Y%m%d_%H%M%S}_{:06d}", fmt::gmtime(secs), micros);
}

fs::path RunInputsPath(const fs::path& run_root, bool inside_box) {
  return inside_box ? fs::path(kContainerInputs) : run_root / "inputs";
}
fs::path RunOutputsPath(const fs::path& run_root, bool inside_box) {
  return inside_box ? fs::path(kContainerOutputs) : run_root / "outputs";
}
fs::path RunCodePath(const fs::path& run_root, bool inside_box) {
  return RunInputsPath(run_root, inside_box) / kCodeFileName;
}
fs::path RunBootstrapPath(const fs::path& run_root, bool inside_box) {
  return RunInputsPath(run_root, inside_box) / kBootstrapFileName;
}
fs::path RunVariablePath(const fs::path& run_root, const std::string& name, bool inside_box) {
  return RunInputsPath(run_root, inside_box) / (name + kVariableExtension);
}

fs::path BootstrapScriptPath() {
  return internal::kDataDir / kBootstrapFileName;
}
fs::path ImageDefinitionPath() {
  return internal::kDataDir / "Dockerfile.runner";
}

fs::path ImageBuildPath() {
  return fs::temp_directory_path() /
      fmt::format("agentbox-build-{}-{}", getpid(), ++build_dir_seq);
}
