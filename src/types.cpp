/**
 * @file types.cpp
 * @brief Error and Message constructors
 */

#include "gif_maker/types.hpp"

#include <utility>

#include <fmt/core.h>

namespace gif_maker {

// **----- Error -----**

Error Error::spawn_failed(std::string detail) {
  Error e;
  e.kind = ErrorKind::SpawnFailed;
  e.detail = std::move(detail);
  return e;
}

Error Error::stream_io(std::string detail) {
  Error e;
  e.kind = ErrorKind::StreamIoFailure;
  e.detail = std::move(detail);
  return e;
}

Error Error::empty_stdout(std::string detail) {
  Error e;
  e.kind = ErrorKind::EmptyStdout;
  e.detail = std::move(detail);
  return e;
}

Error Error::process_failed(int exit_code, int signal, std::string detail) {
  Error e;
  e.kind = ErrorKind::ProcessFailed;
  e.exit_code = exit_code;
  e.signal = signal;
  e.detail = std::move(detail);
  return e;
}

Error Error::cancelled() {
  Error e;
  e.kind = ErrorKind::Cancelled;
  return e;
}

std::string Error::describe() const {
  switch (kind) {
  case ErrorKind::SpawnFailed:
    return fmt::format("failed to start ffmpeg: {}", detail);
  case ErrorKind::StreamIoFailure:
    return fmt::format("pipe I/O failure: {}", detail);
  case ErrorKind::EmptyStdout:
    return "ffmpeg produced no output (unsupported input?)";
  case ErrorKind::ProcessFailed:
    if (signal != 0) {
      return fmt::format("ffmpeg killed by signal {}", signal);
    }
    return fmt::format("ffmpeg exited with code {}", exit_code);
  case ErrorKind::Cancelled:
    return "conversion cancelled";
  }
  return "unknown error";
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SpawnFailed:
    return "SpawnFailed";
  case ErrorKind::StreamIoFailure:
    return "StreamIoFailure";
  case ErrorKind::EmptyStdout:
    return "EmptyStdout";
  case ErrorKind::ProcessFailed:
    return "ProcessFailed";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

// **----- Message -----**

Message Message::video_duration(Millis d) {
  Message m;
  m.type = MessageType::VideoDuration;
  m.duration = d;
  return m;
}

Message Message::progress_update(double fraction) {
  Message m;
  m.type = MessageType::Progress;
  m.progress = fraction;
  return m;
}

Message Message::success(std::vector<uint8_t> bytes) {
  Message m;
  m.type = MessageType::Success;
  m.data = std::move(bytes);
  return m;
}

Message Message::failure(Error e) {
  Message m;
  m.type = MessageType::Error;
  m.error = std::move(e);
  return m;
}

Message Message::done() { return Message{}; }

} // namespace gif_maker
