#ifndef CONFIG_FILE_H_
#define CONFIG_FILE_H_

#include <filesystem>
#include <agentbox/config.h>

// Reads an INI file (all keys in the unnamed section) into config.
// state_root also moves kStateRoot and config.generated_root.
// Returns false if the file cannot be opened.
bool LoadConfigFile(const std::filesystem::path& conf_path, SandboxConfig& config);

#endif  // CONFIG_FILE_H_
