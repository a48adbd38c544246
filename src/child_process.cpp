/**
 * @file child_process.cpp
 * @brief posix_spawn based child process implementation
 *
 * @note Pipes are created close-on-exec: a process spawned by a concurrent
 *       job must never inherit another job's descriptors.
 */

#include "gif_maker/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <system_error>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "gif_maker/logging.hpp"

extern char **environ;

namespace gif_maker {

// **---- Internal Helpers ----**

namespace {

std::string errno_message(int err) {
  return std::system_category().message(err);
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Pipe pair with both ends close-on-exec
bool make_pipe(int fds[2], std::string &error) {
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    error = fmt::format("pipe2 failed: {}", errno_message(errno));
    return false;
  }
  return true;
}

} // anonymous namespace

// **---- Lifecycle ----**

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    if (!exited_.load()) {
      LOG_WARN("Killing unfinished child process {}", pid_);
      ::kill(-pid_, SIGKILL);
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
  }
  close_fds();
}

void ChildProcess::close_fds() {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

bool ChildProcess::spawn(const std::string &program,
                         const std::vector<std::string> &args,
                         std::string &error) {
  int in[2] = {-1, -1};
  int out[2] = {-1, -1};
  int err[2] = {-1, -1};

  auto close_all = [&] {
    close_fd(in[0]);
    close_fd(in[1]);
    close_fd(out[0]);
    close_fd(out[1]);
    close_fd(err[0]);
    close_fd(err[1]);
  };

  if (!make_pipe(in, error) || !make_pipe(out, error) ||
      !make_pipe(err, error)) {
    close_all();
    return false;
  }

  /// Build argv
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  /// Redirect the child's standard streams to the pipes
  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_adddup2(&file_actions, in[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, out[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, err[1], STDERR_FILENO);

  /// The child starts with an empty mask and default dispositions, whatever
  /// the spawning thread has blocked or ignored
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGQUIT);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setsigdefault(&attr, &default_signals);

  /// Own process group (pgid == pid): kill() must also reach whatever a
  /// wrapper script started without exec
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF |
                                      POSIX_SPAWN_SETPGROUP);

  pid_t pid = -1;
  int spawn_ret = ::posix_spawnp(&pid, program.c_str(), &file_actions, &attr,
                                 argv.data(), environ);
  posix_spawn_file_actions_destroy(&file_actions);
  posix_spawnattr_destroy(&attr);

  if (spawn_ret != 0) {
    error = fmt::format("{}: {}", program, errno_message(spawn_ret));
    close_all();
    return false;
  }

  /// Keep only the parent ends
  close_fd(in[0]);
  close_fd(out[1]);
  close_fd(err[1]);

  pid_ = pid;
  stdin_fd_ = in[1];
  stdout_fd_ = out[0];
  stderr_fd_ = err[0];

  /// A full stdin pipe must never block the cancellation path
  int flags = ::fcntl(stdin_fd_, F_GETFL, 0);
  if (flags != -1) {
    ::fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK);
  }

  LOG_DEBUG("Spawned {} (pid {})", program, pid_);
  return true;
}

// **---- Exit handling ----**

bool ChildProcess::wait_exit(ExitStatus &status, std::string &error) {
  siginfo_t info{};
  int ret = 0;
  do {
    ret = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
  } while (ret == -1 && errno == EINTR);

  bool ok = (ret == 0);
  status = ExitStatus{};
  if (ok) {
    if (info.si_code == CLD_EXITED) {
      status.exited = true;
      status.code = info.si_status;
    } else {
      status.signal = info.si_status;
    }
  } else {
    error = fmt::format("waitid failed: {}", errno_message(errno));
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exited_.store(true);
  }
  exit_cv_.notify_all();
  return ok;
}

bool ChildProcess::wait_exited_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return exit_cv_.wait_for(lock, timeout, [this] { return exited_.load(); });
}

void ChildProcess::reap() {
  if (pid_ <= 0 || reaped_)
    return;
  int status = 0;
  while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
  }
  reaped_ = true;
}

// **---- Signalling ----**

bool ChildProcess::write_stdin(const std::string &bytes, std::string &error) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (exited_.load()) {
    error = "process already exited";
    return false;
  }
  if (stdin_fd_ < 0) {
    error = "stdin is closed";
    return false;
  }

  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(stdin_fd_, bytes.data() + written,
                        bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = errno_message(errno);
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

bool ChildProcess::kill() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (exited_.load() || pid_ <= 0)
    return false;
  return ::kill(-pid_, SIGKILL) == 0;
}

} // namespace gif_maker
