#ifndef INCLUDE_AGENTBOX_RETENTION_H_
#define INCLUDE_AGENTBOX_RETENTION_H_

#include <string>
#include <vector>
#include <filesystem>

extern const char kRunDirectoryPrefix[];

// run_YYYYMMDD_HHMMSS_ffffff with a valid date and time
bool IsRunDirectoryName(const std::string&);

// sorted oldest first; anything not matching the naming convention is left out
std::vector<std::filesystem::path> ListRunDirectories(const std::filesystem::path& root);

// Keep the newest max_sessions run directories under root. Best effort: removal
// failures are logged and skipped. Returns the number of directories removed.
size_t PruneRunDirectories(const std::filesystem::path& root, size_t max_sessions);

#endif  // INCLUDE_AGENTBOX_RETENTION_H_
