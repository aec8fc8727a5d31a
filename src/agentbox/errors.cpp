#include <agentbox/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

inline std::string Strip(const std::string& str) {
  constexpr char kWhites[] = " \n\r\t";
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kWhites) - begin + 1);
}

std::string BuildErrorMessage(const std::vector<std::string>& command, int exit_code,
                              const std::string& out, const std::string& err) {
  return fmt::format(
      "Failed to build sandbox image.\nCommand: {}\nReturn code: {}\nSTDOUT:\n{}\nSTDERR:\n{}",
      fmt::join(command, " "), exit_code, Strip(out), Strip(err));
}

} // namespace

ImageBuildError::ImageBuildError(std::vector<std::string> command, int exit_code,
                                 std::string stdout_text, std::string stderr_text) :
    SandboxError(BuildErrorMessage(command, exit_code, stdout_text, stderr_text)),
    command_(std::move(command)),
    exit_code_(exit_code),
    stdout_(std::move(stdout_text)),
    stderr_(std::move(stderr_text)) {}
