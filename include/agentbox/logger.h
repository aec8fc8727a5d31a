#ifndef INCLUDE_AGENTBOX_LOGGER_H_
#define INCLUDE_AGENTBOX_LOGGER_H_

#include <filesystem>

// Colored stderr plus a rotating agentbox.log under log_dir (skipped if log_dir is empty
// or cannot be created). Level is left to the caller.
void InitLogger(const std::filesystem::path& log_dir = {});

#endif  // INCLUDE_AGENTBOX_LOGGER_H_
