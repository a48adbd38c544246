/**
 * @file converter.hpp
 * @brief Conversion job orchestration
 *
 * @details The Converter turns one Settings value into one animated GIF by
 *          running FFmpeg as a child process:
 *
 *          1. Spawn FFmpeg with stdin/stdout/stderr piped
 *
 *          2. Launch three workers: stdout collector, stderr parser,
 *             cancellation controller
 *
 *          3. Wait for process exit, then join every worker
 *
 *          4. Reconcile the workers' results into one terminal message
 *
 *          5. Send Done
 *
 * @note Everything the caller learns arrives on the message channel; convert()
 *       itself returns nothing.
 */

#ifndef GIF_MAKER_CONVERTER_HPP
#define GIF_MAKER_CONVERTER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "channel.hpp"
#include "child_process.hpp"
#include "settings.hpp"
#include "types.hpp"

namespace gif_maker {

/// What the stdout collector leaves behind
struct StdoutResult {
  std::vector<uint8_t> data;
  bool io_failed = false;
  std::string error;
};

/// What the stderr parser leaves behind
struct StderrResult {
  std::deque<std::string> tail; //< Last lines, for the error detail
  bool io_failed = false;
  std::string error;
};

/**
 * @struct JobOutcome
 * @brief Everything known about a job once its workers have been joined.
 */
struct JobOutcome {
  bool cancelled = false;
  StdoutResult out;
  StderrResult err;
  bool status_known = false; //< false if waiting for the process failed
  ExitStatus status;
  std::string wait_error;
};

/**
 * @brief Reduce a finished job to its single terminal message.
 *
 * @attention PRIORITY (first match wins):
 *
 *   1. Cancelled (partial output is discarded)
 *
 *   2. StreamIoFailure, stdout before stderr
 *
 *   3. EmptyStdout
 *
 *   4. ProcessFailed: unknown status, nonzero exit code or signal
 *
 *   5. Success with the collected bytes
 */
Message reconcile(JobOutcome outcome);

/**
 * @class Converter
 * @brief Runs a single conversion job and reports it as a Message stream.
 *
 * @attention USAGE:
 *
 *   - Keep messages() and commands() before handing the Converter to a thread
 *
 *   - Call convert() once; it blocks until Done has been sent
 *
 *   - Send Command::Cancel on commands() to stop the job early
 */
class Converter {
public:
  Converter();

  Converter(const Converter &) = delete;
  Converter &operator=(const Converter &) = delete;

  /// Outbound events (the caller reads)
  std::shared_ptr<MessageChannel> messages() const { return messages_; }

  /// Inbound requests (the caller writes)
  std::shared_ptr<CommandChannel> commands() const { return commands_; }

  /**
   * @brief Time FFmpeg gets to honor the quit command before it is killed.
   * @note Defaults to CANCEL_GRACE_MS.
   */
  void set_cancel_grace(std::chrono::milliseconds grace) { grace_ = grace; }

  /**
   * @brief Run the job described by @p settings to completion.
   * @note Blocks the calling thread. Exactly one Success or Error followed by
   *       Done is sent, whatever happens.
   */
  void convert(const Settings &settings);

private:
  void fail_before_start(Error error);

  void read_stdout(ChildProcess &child, StdoutResult &result);
  void read_stderr(ChildProcess &child, StderrResult &result);
  void control_cancellation(ChildProcess &child,
                            const std::atomic<bool> &process_exited,
                            std::atomic<bool> &cancelled);

  std::shared_ptr<MessageChannel> messages_;
  std::shared_ptr<CommandChannel> commands_;
  std::chrono::milliseconds grace_;
  std::atomic<bool> used_{false};
};

} // namespace gif_maker

#endif // GIF_MAKER_CONVERTER_HPP
