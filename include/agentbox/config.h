#ifndef INCLUDE_AGENTBOX_CONFIG_H_
#define INCLUDE_AGENTBOX_CONFIG_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

extern const char kDefaultImage[];
// when set, names a pre-built image and disables building
extern const char kImageOverrideEnv[];
extern const char kStateRootEnv[];
constexpr size_t kDefaultMaxSessions = 50;

class RuntimeOptions {
 public:
  std::string backend; // container CLI
  std::string daemon; // started in background if the backend is unreachable
  std::filesystem::path daemon_socket; // readiness signal
  std::filesystem::path daemon_log;
  int daemon_poll_count;
  std::chrono::milliseconds daemon_poll_interval;
  // prefixed to every backend/daemon invocation, e.g. {"wsl.exe"}
  std::vector<std::string> shell_wrapper;
  // C:\a\b -> /mnt/c/a/b
  bool convert_drive_paths;
  bool disable_network;
  std::filesystem::path image_definition;

  RuntimeOptions();
};

class SandboxConfig {
 public:
  std::string image;
  bool build_image; // false for pre-built images
  std::filesystem::path generated_root;
  size_t max_sessions;
  RuntimeOptions runtime;

  SandboxConfig();
};

// Apply AGENTBOX_RUNNER_IMAGE if present
void ApplyEnvironment(SandboxConfig&);

#endif  // INCLUDE_AGENTBOX_CONFIG_H_
