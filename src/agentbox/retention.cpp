#include <agentbox/retention.h>

#include <algorithm>
#include <spdlog/spdlog.h>
#include "utils.h"

const char kRunDirectoryPrefix[] = "run_";

namespace {

// parses exactly len decimal digits
bool ParseDigits(const std::string& str, size_t pos, size_t len, int& out) {
  if (pos + len > str.size()) return false;
  out = 0;
  for (size_t i = pos; i < pos + len; i++) {
    if (str[i] < '0' || str[i] > '9') return false;
    out = out * 10 + (str[i] - '0');
  }
  return true;
}

int DaysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) return 29;
  return kDays[month - 1];
}

} // namespace

bool IsRunDirectoryName(const std::string& name) {
  // run_YYYYMMDD_HHMMSS_ffffff
  constexpr size_t kPrefixLen = sizeof(kRunDirectoryPrefix) - 1;
  if (name.size() != kPrefixLen + 22) return false;
  if (name.compare(0, kPrefixLen, kRunDirectoryPrefix) != 0) return false;
  size_t pos = kPrefixLen;
  if (name[pos + 8] != '_' || name[pos + 15] != '_') return false;
  int year, month, day, hour, minute, second, micros;
  if (!ParseDigits(name, pos, 4, year) ||
      !ParseDigits(name, pos + 4, 2, month) ||
      !ParseDigits(name, pos + 6, 2, day) ||
      !ParseDigits(name, pos + 9, 2, hour) ||
      !ParseDigits(name, pos + 11, 2, minute) ||
      !ParseDigits(name, pos + 13, 2, second) ||
      !ParseDigits(name, pos + 16, 6, micros)) {
    return false;
  }
  if (year < 1 || month < 1 || month > 12) return false;
  if (day < 1 || day > DaysInMonth(year, month)) return false;
  // leap seconds are accepted
  return hour < 24 && minute < 60 && second <= 61;
}

std::vector<fs::path> ListRunDirectories(const fs::path& root) {
  std::vector<fs::path> ret;
  std::error_code ec;
  fs::directory_iterator it(root, ec), end;
  if (ec) {
    spdlog::debug("Cannot list {}: {}", root.c_str(), ec.message());
    return ret;
  }
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_directory(type_ec)) continue;
    if (!IsRunDirectoryName(it->path().filename().string())) continue;
    ret.push_back(it->path());
  }
  // the naming scheme sorts chronologically
  std::sort(ret.begin(), ret.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return ret;
}

size_t PruneRunDirectories(const fs::path& root, size_t max_sessions) {
  std::vector<fs::path> runs = ListRunDirectories(root);
  if (runs.size() <= max_sessions) return 0;
  size_t to_remove = runs.size() - max_sessions, removed = 0;
  for (size_t i = 0; i < to_remove; i++) {
    std::error_code ec;
    fs::remove_all(runs[i], ec);
    if (ec) {
      spdlog::warn("Failed to prune old run directory {}: {}", runs[i].c_str(), ec.message());
      continue;
    }
    removed++;
  }
  spdlog::info("Pruned {} old run directories under {}", removed, root.c_str());
  return removed;
}
