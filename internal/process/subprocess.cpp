#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

extern char** environ;

namespace slideshow::process {

namespace {

using Clock = std::chrono::steady_clock;

// Closes the fd on scope exit.
class FileDescriptor {
 public:
  explicit FileDescriptor(int fd = -1) : fd_(fd) {
  }
  ~FileDescriptor() {
    Reset();
  }
  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }
  void Reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

class SpawnFileActions {
 public:
  SpawnFileActions() {
    posix_spawn_file_actions_init(&actions_);
  }
  ~SpawnFileActions() {
    posix_spawn_file_actions_destroy(&actions_);
  }
  SpawnFileActions(const SpawnFileActions&)            = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  posix_spawn_file_actions_t* Get() {
    return &actions_;
  }

 private:
  posix_spawn_file_actions_t actions_;
};

void AppendTail(std::string& tail, const char* data, std::size_t n) {
  tail.append(data, n);
  if (tail.size() > kDiagnosticTailBytes) {
    tail.erase(0, tail.size() - kDiagnosticTailBytes);
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

int WaitBlocking(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return DecodeStatus(status);
}

int OpenPidFd(pid_t pid) {
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
}

int RemainingMs(bool bounded, Clock::time_point deadline) {
  if (!bounded) return -1;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw SpawnError("empty command line", EINVAL);
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw SpawnError(std::string("pipe: ") + std::strerror(errno), errno);
  }
  FileDescriptor read_end(fds[0]);
  FileDescriptor write_end(fds[1]);

  SpawnFileActions actions;
  posix_spawn_file_actions_addopen(actions.Get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(actions.Get(), write_end.Get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(actions.Get(), write_end.Get(), STDERR_FILENO);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  pid_t pid = 0;
  int   rc  = ::posix_spawnp(&pid, cargv[0], actions.Get(), nullptr, cargv.data(), environ);
  if (rc != 0) {
    throw SpawnError("cannot start " + argv[0] + ": " + std::strerror(rc), rc);
  }
  // only the child holds the write end now; EOF arrives when it exits
  write_end.Reset();

  ProcessResult result;
  const bool    bounded  = timeout.count() > 0;
  const auto    deadline = Clock::now() + timeout;

  // readable once the child exits; -1 on kernels without pidfd_open
  FileDescriptor exit_fd(OpenPidFd(pid));

  const bool has_exit_fd = exit_fd.Get() >= 0;
  bool       pipe_open   = true;
  bool       exited      = false;
  char       buffer[4096];

  while (!exited && (pipe_open || has_exit_fd)) {
    // poll skips negative descriptors
    pollfd watched[2] = {{pipe_open ? read_end.Get() : -1, POLLIN, 0}, {exit_fd.Get(), POLLIN, 0}};

    int ready = ::poll(watched, 2, RemainingMs(bounded, deadline));
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) {
      result.timed_out = true;
      break;
    }

    if (pipe_open && watched[0].revents != 0) {
      ssize_t n = ::read(read_end.Get(), buffer, sizeof(buffer));
      if (n > 0) {
        AppendTail(result.diagnostics, buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        pipe_open = false;
      }
    }
    if (has_exit_fd && watched[1].revents != 0) {
      exited = true;
    }
  }

  // the child is gone; keep what it left in the pipe, ignore descendants still holding it
  while (exited && pipe_open) {
    pollfd pfd{read_end.Get(), POLLIN, 0};
    if (::poll(&pfd, 1, 0) <= 0) break;
    ssize_t n = ::read(read_end.Get(), buffer, sizeof(buffer));
    if (n <= 0) break;
    AppendTail(result.diagnostics, buffer, static_cast<std::size_t>(n));
  }

  if (result.timed_out) {
    ::kill(pid, SIGKILL);
  }
  // without a pidfd the deadline only covers the output stream
  result.exit_code = WaitBlocking(pid);
  return result;
}

std::optional<std::string> FindExecutable(const std::string& name) {
  if (name.empty()) return std::nullopt;

  auto is_executable = [](const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
  };

  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) return name;
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  std::string search   = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  std::size_t start = 0;
  while (start <= search.size()) {
    auto        end = search.find(':', start);
    std::string dir = search.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (dir.empty()) dir = ".";

    std::string candidate = dir + "/" + name;
    if (is_executable(candidate)) return candidate;

    if (end == std::string::npos) break;
    start = end + 1;
  }
  return std::nullopt;
}

} // namespace slideshow::process
