/**
 * @file types.hpp
 * @brief Core data types for GIF Maker
 *
 * @details Contains the values exchanged between a conversion job and its
 *          caller:
 *
 *          - ErrorKind and Error for terminal failures
 *
 *          - Message, the tagged event sent on the outbound channel
 *
 *          - Command, the requests accepted on the inbound channel
 */

#ifndef GIF_MAKER_TYPES_HPP
#define GIF_MAKER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace gif_maker {

/// Durations are tracked with millisecond precision (FFmpeg prints centiseconds)
using Millis = std::chrono::milliseconds;

// **----- ERRORS -----**

/**
 * @brief Taxonomy of terminal failures.
 */
enum class ErrorKind {
  SpawnFailed,     //< Tool missing/unexecutable, or the job could not start
  StreamIoFailure, //< Read failure on a pipe while the job was running
  EmptyStdout,     //< Process finished but wrote no output bytes
  ProcessFailed,   //< Nonzero exit status or killed by a signal
  Cancelled,       //< Cancellation honored before natural completion
};

/**
 * @struct Error
 * @brief A terminal failure, carried by Message::error.
 * @note exit_code and signal are only meaningful for ProcessFailed.
 *       detail holds the OS error text or the diagnostic tail of the tool.
 */
struct Error {
  ErrorKind kind = ErrorKind::ProcessFailed;
  int exit_code = 0; //< Exit code when the process exited normally
  int signal = 0;    //< Terminating signal, 0 if it exited normally
  std::string detail;

  static Error spawn_failed(std::string detail);
  static Error stream_io(std::string detail);
  static Error empty_stdout(std::string detail = {});
  static Error process_failed(int exit_code, int signal, std::string detail);
  static Error cancelled();

  /**
   * @brief Human-readable one-line description.
   */
  std::string describe() const;
};

/// Stable name of an ErrorKind ("SpawnFailed", ...)
const char *to_string(ErrorKind kind);

// **----- MESSAGES -----**

/**
 * @brief Discriminator for Message.
 */
enum class MessageType {
  VideoDuration,
  Progress,
  Success,
  Error,
  Done,
};

/**
 * @struct Message
 * @brief An event sent to the caller by the Converter.
 *
 * @attention ORDERING within one job:
 *
 *   - VideoDuration is sent at most once, before any Progress
 *
 *   - Exactly one Success or Error, immediately followed by Done
 *
 *   - Nothing is sent after Done
 */
struct Message {
  MessageType type = MessageType::Done;
  Millis duration{0};        //< VideoDuration payload
  double progress = 0.0;     //< Progress payload, in [0, 1]
  std::vector<uint8_t> data; //< Success payload (encoded GIF bytes)
  Error error;               //< Error payload

  static Message video_duration(Millis d);
  static Message progress_update(double fraction);
  static Message success(std::vector<uint8_t> bytes);
  static Message failure(Error e);
  static Message done();

  bool is_terminal() const {
    return type == MessageType::Success || type == MessageType::Error;
  }
};

// **----- COMMANDS -----**

/**
 * @brief A request sent to the Converter by the caller.
 * @note Cancel results in Error(Cancelled) when it reaches a running job.
 *       Sending it after the job concluded has no effect.
 */
enum class Command {
  Cancel,
};

} // namespace gif_maker

#endif // GIF_MAKER_TYPES_HPP
