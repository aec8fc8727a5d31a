#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

// argv as execvp wants it; valid as long as the strings are
std::vector<char*> ToArgv(const std::vector<std::string>& argv) {
  std::vector<char*> ret;
  ret.reserve(argv.size() + 1);
  for (auto& i : argv) ret.push_back(const_cast<char*>(i.c_str()));
  ret.push_back(nullptr);
  return ret;
}

inline void ClosePipe(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
}

inline int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

CommandResult RunProcess(const std::vector<std::string>& argv) {
  CommandResult ret;
  ret.command = argv;
  if (argv.empty()) throw std::invalid_argument("empty command");

  spdlog::debug("Run command: {}", fmt::format("{}", argv));
  std::vector<char*> args = ToArgv(argv);
  // prepared before fork; the child only makes async-signal-safe calls
  std::string exec_error = "failed to execute " + argv[0] + "\n";

  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1};
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0) {
    int err = errno;
    ClosePipe(outpipe);
    ClosePipe(errpipe);
    throw std::system_error(err, std::generic_category(), "pipe");
  }
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    ClosePipe(outpipe);
    ClosePipe(errpipe);
    throw std::system_error(err, std::generic_category(), "fork");
  }
  if (pid == 0) {
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, 0);
    dup2(outpipe[1], 1);
    dup2(errpipe[1], 2);
    execvp(args[0], args.data());
    IGNORE_RETURN(write(2, exec_error.data(), exec_error.size()));
    _exit(127);
  }
  close(outpipe[1]);
  close(errpipe[1]);

  struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
  std::string* bufs[2] = {&ret.stdout_text, &ret.stderr_text};
  int open_fds = 2;
  char buf[65536];
  while (open_fds) {
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: errno={} {}", errno, strerror(errno));
      break;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        bufs[i]->append(buf, n);
      } else if (n == 0 || errno != EINTR) {
        close(fds[i].fd);
        fds[i].fd = -1; // poll ignores negative fds
        open_fds--;
      }
    }
  }
  for (auto& i : fds) {
    if (i.fd >= 0) close(i.fd);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("waitpid error: errno={} {}", errno, strerror(errno));
      return ret;
    }
  }
  ret.exit_code = DecodeStatus(status);
  spdlog::debug("Command {} exited with {}", argv[0], ret.exit_code);
  return ret;
}

bool SpawnDetachedProcess(const std::vector<std::string>& argv, const std::filesystem::path& log_file) {
  if (argv.empty()) return false;
  spdlog::debug("Spawn detached: {} > {}", fmt::format("{}", argv), log_file.c_str());
  std::vector<char*> args = ToArgv(argv);
  std::string log_path = log_file.string();

  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("fork error: errno={} {}", errno, strerror(errno));
    return false;
  }
  if (pid == 0) {
    pid_t pid2 = fork();
    if (pid2 < 0) _exit(1);
    if (pid2 == 0) {
      setsid();
      int devnull = open("/dev/null", O_RDWR);
      int log_fd = log_path.empty() ? -1 : open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
      if (log_fd < 0) log_fd = devnull;
      if (devnull >= 0) dup2(devnull, 0);
      if (log_fd >= 0) {
        dup2(log_fd, 1);
        dup2(log_fd, 2);
      }
      execvp(args[0], args.data());
      _exit(127);
    }
    _exit(0);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

CommandResult SystemCommandRunner::Run(const std::vector<std::string>& argv) {
  return RunProcess(argv);
}

bool SystemCommandRunner::SpawnDetached(const std::vector<std::string>& argv,
                                        const std::filesystem::path& log_file) {
  return SpawnDetachedProcess(argv, log_file);
}
