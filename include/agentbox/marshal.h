#ifndef INCLUDE_AGENTBOX_MARSHAL_H_
#define INCLUDE_AGENTBOX_MARSHAL_H_

#include <set>
#include <string>
#include <vector>
#include <filesystem>

#include "variable.h"

// every variable file ends with this; the loader inside the box tries the
// tabular format first and falls back to the generic one
extern const char kVariableExtension[];

// All identifier-like tokens in the code. No scope or string-literal awareness:
// a name inside a comment or a string is still a token.
std::set<std::string> ScanIdentifiers(const std::string& code);

// Subset of ns whose keys appear as tokens in code. May include too much, never too little.
Namespace SelectUsedVariables(const std::string& code, const Namespace& ns);

// TABLE -> Arrow IPC file, GENERIC -> CBOR. Throws MarshalError.
void SerializeVariable(const Variable&, const std::filesystem::path& dest);

// returns the names written into inputs_dir
std::vector<std::string> MarshalVariables(
    const std::string& code, const Namespace& ns, const std::filesystem::path& inputs_dir);

#endif  // INCLUDE_AGENTBOX_MARSHAL_H_
