#ifndef AGENTBOX_PATHS_H_
#define AGENTBOX_PATHS_H_

#include <agentbox/paths.h>

extern const char kCodeFileName[];
extern const char kBootstrapFileName[];
extern const char kLogFileName[];

// temporary build context for the image; unique within this process
fs::path ImageBuildPath();

#endif  // AGENTBOX_PATHS_H_
