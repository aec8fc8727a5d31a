#ifndef AGENTBOX_UTILS_H_
#define AGENTBOX_UTILS_H_

#include <string>

#include "variable.h"
#include "run_session.h"

// logging
const char* SessionStatusName(SessionStatus);
const char* VariableKindName(VariableKind);

const char* ColumnTypeName(ColumnType);
// returns false if str is not a known dtype
bool GetColumnType(const std::string& str, ColumnType& type);

// C:\Users\me -> /mnt/c/Users/me; other paths only get their separators replaced
std::string ToPosixMountPath(const std::string& path, const std::string& prefix = "/mnt");

#endif  // AGENTBOX_UTILS_H_
