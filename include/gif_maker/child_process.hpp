/**
 * @file child_process.hpp
 * @brief RAII handle for a spawned process with piped standard streams
 *
 * @details The process is started with posix_spawnp in a new process group,
 *          with all three standard streams redirected to pipes owned by this
 *          object.
 *
 * @attention EXIT vs. REAP:
 *
 *   - wait_exit() blocks until the process has terminated but leaves it as
 *     a zombie, so its pid cannot be recycled while signals may still be
 *     sent to it
 *
 *   - kill() and write_stdin() are no-ops once exit has been observed
 *
 *   - reap() collects the zombie; call it once nobody will signal anymore
 */

#ifndef GIF_MAKER_CHILD_PROCESS_HPP
#define GIF_MAKER_CHILD_PROCESS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace gif_maker {

/**
 * @struct ExitStatus
 * @brief How the process terminated.
 */
struct ExitStatus {
  bool exited = false; //< true: normal exit with code, false: killed
  int code = -1;       //< Exit code when exited
  int signal = 0;      //< Terminating signal when !exited

  bool success() const { return exited && code == 0; }
};

/**
 * @class ChildProcess
 * @brief Owns the pid and the parent ends of the stdin/stdout/stderr pipes.
 * @note Not copyable, not movable: worker threads hold references to it.
 */
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /**
   * @brief Start @p program with @p args (argv[0] is added).
   * @param error Output: OS error description on failure
   * @return true if the process is running
   * @note @p program is searched in PATH unless it contains a '/'.
   */
  bool spawn(const std::string &program, const std::vector<std::string> &args,
             std::string &error);

  pid_t pid() const { return pid_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  /**
   * @brief Block until the process terminates, without reaping it.
   * @param status Output: how the process terminated
   * @param error Output: OS error description if the status is unknown
   * @return false if the status could not be collected
   * @note Marks the process as exited either way and wakes every
   *       wait_exited_for() caller.
   */
  bool wait_exit(ExitStatus &status, std::string &error);

  /**
   * @brief Wait at most @p timeout for wait_exit() to observe termination.
   * @return true if the process has exited
   */
  bool wait_exited_for(std::chrono::milliseconds timeout);

  bool has_exited() const { return exited_.load(); }

  /**
   * @brief Write all of @p bytes to the process's stdin.
   * @param error Output: OS error description on failure
   * @return false if the write failed or the process already exited
   * @note Callers must have SIGPIPE blocked in the writing thread.
   */
  bool write_stdin(const std::string &bytes, std::string &error);

  /**
   * @brief Send SIGKILL to the process group unless exit was already
   *        observed.
   * @note The child leads its own group, so descendants it did not exec
   *       into are killed with it.
   * @return true if the signal was sent
   */
  bool kill();

  /**
   * @brief Collect the terminated process.
   * @note Only valid after wait_exit().
   */
  void reap();

private:
  void close_fds();

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool reaped_ = false;

  std::atomic<bool> exited_{false};
  std::mutex state_mutex_; //< Serializes signals/stdin writes against exit
  std::condition_variable exit_cv_;
};

} // namespace gif_maker

#endif // GIF_MAKER_CHILD_PROCESS_HPP
