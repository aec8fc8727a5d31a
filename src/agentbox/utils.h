#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <utility>
#include <filesystem>

#include <agentbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// runs a callable when leaving scope, on every path
template <class Func>
class ScopeGuard {
  Func func_;
  bool active_;
 public:
  explicit ScopeGuard(Func func) : func_(std::move(func)), active_(true) {}
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ~ScopeGuard() { if (active_) func_(); }
  void Dismiss() { active_ = false; }
};

// These log a warning and return false on failure
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool CreateFreshDir(const fs::path&);
bool RemoveAll(const fs::path&);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string& content);
bool ReadFile(const fs::path&, std::string& content);

#endif  // UTILS_H_
