#include <agentbox/config.h>

#include <cstdlib>

#include <spdlog/spdlog.h>
#include "paths.h"

const char kDefaultImage[] = "agentbox-runner:py313";
const char kImageOverrideEnv[] = "AGENTBOX_RUNNER_IMAGE";
const char kStateRootEnv[] = "AGENTBOX_STATE";

RuntimeOptions::RuntimeOptions() :
    backend("docker"),
    daemon("dockerd"),
    daemon_socket("/var/run/docker.sock"),
    daemon_log("/var/log/dockerd.log"),
    daemon_poll_count(10),
    daemon_poll_interval(1000),
#ifdef _WIN32
    shell_wrapper{"wsl.exe"},
    convert_drive_paths(true),
#else
    convert_drive_paths(false),
#endif
    disable_network(true),
    image_definition(ImageDefinitionPath()) {}

SandboxConfig::SandboxConfig() :
    image(kDefaultImage),
    build_image(true),
    generated_root(GeneratedRoot()),
    max_sessions(kDefaultMaxSessions) {}

void ApplyEnvironment(SandboxConfig& config) {
  const char* image = std::getenv(kImageOverrideEnv);
  if (!image || !*image) return;
  spdlog::info("Using pre-built image {} from {}", image, kImageOverrideEnv);
  config.image = image;
  config.build_image = false;
}
