#ifndef PROCESS_H_
#define PROCESS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <agentbox/container_runtime.h>

// fork + execvp with stdout and stderr captured through pipes; stdin is /dev/null.
// The program is looked up in PATH. Throws std::system_error if pipe/fork fails.
CommandResult RunProcess(const std::vector<std::string>& argv);

// Double-fork so the daemon is reparented and never becomes our zombie.
bool SpawnDetachedProcess(const std::vector<std::string>& argv, const std::filesystem::path& log_file);

#endif  // PROCESS_H_
