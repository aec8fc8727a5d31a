#include <agentbox/logger.h>

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr size_t kMaxLogSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 5;

} // namespace

void InitLogger(const fs::path& log_dir) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_dir.empty() && CreateDirs(log_dir)) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          (log_dir / kLogFileName).string(), kMaxLogSize, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::warn("Cannot open log file under {}: {}", log_dir.c_str(), ex.what());
    }
  }
  auto logger = std::make_shared<spdlog::logger>("agentbox", sinks.begin(), sinks.end());
  logger->set_level(spdlog::get_level());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Logger initialized with {} sinks", sinks.size());
}
