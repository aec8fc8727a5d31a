#ifndef INCLUDE_AGENTBOX_PATHS_H_
#define INCLUDE_AGENTBOX_PATHS_H_

#include <chrono>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// state root; generated/ and logs/ live under it
extern fs::path kStateRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// mount points inside the container
extern const char kContainerInputs[];
extern const char kContainerOutputs[];

// AGENTBOX_STATE, then $XDG_STATE_HOME/agentbox, then ~/.local/state/agentbox
fs::path DefaultStateRoot();
fs::path GeneratedRoot();
fs::path LogRoot();

// run_YYYYMMDD_HHMMSS_ffffff in UTC; names sort chronologically
std::string RunDirectoryName(std::chrono::system_clock::time_point);

// if inside_box = true, run_root is not used
fs::path RunInputsPath(const fs::path& run_root, bool inside_box = false);
fs::path RunOutputsPath(const fs::path& run_root, bool inside_box = false);
fs::path RunCodePath(const fs::path& run_root, bool inside_box = false);
fs::path RunBootstrapPath(const fs::path& run_root, bool inside_box = false);
fs::path RunVariablePath(const fs::path& run_root, const std::string& name, bool inside_box = false);

// packaged resources
fs::path BootstrapScriptPath();
fs::path ImageDefinitionPath();

#endif  // INCLUDE_AGENTBOX_PATHS_H_
