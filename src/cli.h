#ifndef CLI_H_
#define CLI_H_

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <agentbox/config.h>
#include <agentbox/container_runtime.h>

extern const char kDefaultConfigPath[];
constexpr int kInfraErrorExitCode = 125;

struct CliOptions {
  std::string code_file = "-"; // "-" for stdin
  std::string vars_file;
  std::optional<std::string> config_file;
  std::optional<std::string> image;
  std::optional<std::string> state_root;
  std::optional<size_t> keep;
  bool allow_network = false;
  bool json_output = false;
  bool prune_only = false;
  int verbosity = 0;
};

// args[0] is the program name
// throws std::invalid_argument carrying the message and usage text
CliOptions ParseCommandLine(const std::vector<std::string>& args);

// configuration file, then AGENTBOX_RUNNER_IMAGE, then command-line flags
// the default file is read only if it exists; an explicit one must be readable
bool ResolveConfig(const CliOptions& opt, SandboxConfig& config,
                   const std::filesystem::path& default_config_path = kDefaultConfigPath);

// Returns the exit code of the sandboxed code, kInfraErrorExitCode if the
// sandbox itself failed, or 1 for unreadable input.
int RunCli(const CliOptions& opt, const SandboxConfig& config, std::unique_ptr<CommandRunner> runner,
           std::istream& in, std::ostream& out, std::ostream& err);

#endif  // CLI_H_
