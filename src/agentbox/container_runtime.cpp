#include <agentbox/container_runtime.h>

#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <agentbox/errors.h>
#include "paths.h"
#include "utils.h"

nlohmann::json ExecutionResult::ToJson() const {
  return {
    {"stdout", stdout_text},
    {"stderr", stderr_text},
    {"returncode", exit_code},
    {"success", Success()},
  };
}

std::vector<std::string> ContainerRuntime::Wrap_(std::vector<std::string> argv) const {
  if (opt_.shell_wrapper.empty()) return argv;
  std::vector<std::string> ret = opt_.shell_wrapper;
  ret.insert(ret.end(), argv.begin(), argv.end());
  return ret;
}

CommandResult ContainerRuntime::Invoke_(const std::vector<std::string>& argv) {
  return runner_.Run(Wrap_(argv));
}

std::string ContainerRuntime::ToBackendPath(const fs::path& path) const {
  const std::string& str = path.string();
  if (opt_.convert_drive_paths) {
    // drive-letter paths only make sense on the host side of the wrapper; don't resolve them here
    if (str.size() >= 2 && str[1] == ':') return ToPosixMountPath(str);
    return ToPosixMountPath(fs::weakly_canonical(fs::absolute(path)).string());
  }
  return fs::weakly_canonical(fs::absolute(path)).string();
}

void ContainerRuntime::EnsureDaemonRunning() {
  if (Invoke_({opt_.backend, "ps"}).exit_code == 0) return;

  spdlog::info("Container backend unreachable; starting {}", opt_.daemon);
  if (!runner_.SpawnDetached(Wrap_({opt_.daemon}), opt_.daemon_log)) {
    throw DaemonUnavailableError("failed to start " + opt_.daemon);
  }
  std::error_code ec;
  for (int left = opt_.daemon_poll_count; !fs::exists(opt_.daemon_socket, ec); left--) {
    if (left <= 0) {
      throw DaemonUnavailableError(fmt::format(
          "{} did not create {} within {} polls of {}ms; see {}",
          opt_.daemon, opt_.daemon_socket.c_str(), opt_.daemon_poll_count,
          opt_.daemon_poll_interval.count(), opt_.daemon_log.c_str()));
    }
    std::this_thread::sleep_for(opt_.daemon_poll_interval);
  }
  spdlog::info("{} is ready", opt_.daemon);
}

bool ContainerRuntime::ImageExists(const std::string& image) {
  cache_.RecordProbe();
  return Invoke_({opt_.backend, "image", "inspect", image}).exit_code == 0;
}

void ContainerRuntime::EnsureImage(const std::string& image) {
  EnsureDaemonRunning();
  // looked up on every call; the image can be removed outside this process
  if (ImageExists(image)) {
    spdlog::debug("Image {} exists", image);
    cache_.MarkReady(image);
    return;
  }
  if (cache_.IsReady(image)) {
    spdlog::warn("Image {} disappeared since it was last seen, rebuilding", image);
    cache_.Invalidate(image);
  }

  spdlog::info("Image {} not found, building from {}", image, opt_.image_definition.c_str());
  std::string definition;
  if (!ReadFile(opt_.image_definition, definition)) {
    throw ImageBuildError({}, -1, "", "cannot read image definition " + opt_.image_definition.string());
  }
  fs::path build_dir = ImageBuildPath();
  ScopeGuard cleanup([&build_dir]() { RemoveAll(build_dir); });
  fs::path dockerfile = build_dir / "Dockerfile";
  if (!CreateDirs(build_dir) || !WriteFile(dockerfile, definition)) {
    throw ImageBuildError({}, -1, "", "cannot prepare build context " + build_dir.string());
  }

  std::vector<std::string> cmd = {
    opt_.backend, "build", "-t", image, "-f", ToBackendPath(dockerfile), ToBackendPath(build_dir),
  };
  CommandResult res = Invoke_(cmd);
  if (res.exit_code != 0) {
    throw ImageBuildError(Wrap_(cmd), res.exit_code, res.stdout_text, res.stderr_text);
  }
  cache_.RecordBuild();
  cache_.MarkReady(image);
  spdlog::info("Successfully built image {}", image);
}

std::vector<std::string> ContainerRuntime::RunCommandLine(
    const std::string& image, const fs::path& inputs_dir, const fs::path& outputs_dir) const {
  std::vector<std::string> cmd = {opt_.backend, "run", "--rm"};
  if (opt_.disable_network) cmd.insert(cmd.end(), {"--network", "none"});
  cmd.insert(cmd.end(), {
    "-v", ToBackendPath(inputs_dir) + ":" + kContainerInputs + ":ro",
    "-v", ToBackendPath(outputs_dir) + ":" + kContainerOutputs + ":rw",
    image,
    "python", "-u", RunBootstrapPath({}, true).string(),
  });
  return Wrap_(cmd);
}

ExecutionResult ContainerRuntime::Run(
    const std::string& image, const fs::path& inputs_dir, const fs::path& outputs_dir) {
  EnsureDaemonRunning();
  std::vector<std::string> cmd = RunCommandLine(image, inputs_dir, outputs_dir);
  spdlog::info("Running container: {}", fmt::join(cmd, " "));
  CommandResult res = runner_.Run(cmd);
  cache_.RecordRun();
  // some backend errors only show up on stdout
  if (res.exit_code != 0 && res.stderr_text.empty()) res.stderr_text = res.stdout_text;
  spdlog::info("Container exited with {}", res.exit_code);
  return ExecutionResult(std::move(res.stdout_text), std::move(res.stderr_text), res.exit_code);
}
