#include "utils.h"

#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <algorithm>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;

#define X(...) X_RETURN_ARG1(SessionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionStatusName, SessionStatus, ENUM_SESSION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(VariableKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VariableKindName, VariableKind, ENUM_VARIABLE_KIND_)
#undef X

static const char* kColumnTypeNameTable[] = {
#define X(name, dtype) dtype,
  ENUM_COLUMN_TYPE_
#undef X
};

const char* ColumnTypeName(ColumnType type) {
  return kColumnTypeNameTable[(int)type];
}

bool GetColumnType(const std::string& str, ColumnType& type) {
  for (size_t i = 0; i < sizeof(kColumnTypeNameTable) / sizeof(kColumnTypeNameTable[0]); i++) {
    if (str == kColumnTypeNameTable[i]) {
      type = (ColumnType)i;
      return true;
    }
  }
  return false;
}

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1

std::string ToPosixMountPath(const std::string& path, const std::string& prefix) {
  std::string ret;
  if (path.size() >= 3 && std::isalpha((unsigned char)path[0]) && path[1] == ':' &&
      (path[2] == '\\' || path[2] == '/')) {
    ret = prefix + '/' + (char)std::tolower((unsigned char)path[0]) + '/' + path.substr(3);
  } else {
    ret = path;
  }
  std::replace(ret.begin(), ret.end(), '\\', '/');
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool CreateFreshDir(const fs::path& path) {
  spdlog::debug("Create directory {}", path.c_str());
  std::error_code ec;
  if (fs::create_directory(path, ec)) return true;
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  } else {
    spdlog::warn("Failed creating directory {}: already exists", path.c_str());
  }
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout || !fout.write(content.data(), content.size())) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}
