/**
 * @file converter.cpp
 * @brief Conversion job orchestration implementation
 *
 * @details Thread layout of one job:
 *
 *          - Calling thread: spawns FFmpeg, waits for exit, joins, reconciles
 *
 *          - stdout worker: collects the GIF bytes
 *
 *          - stderr worker: parses duration/progress, keeps a diagnostic tail
 *
 *          - cancel worker: waits for Command::Cancel or process exit
 *
 * @note Each worker writes only to its own result struct; the calling thread
 *       reads those structs after every worker has been joined.
 */

#include "gif_maker/converter.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <functional>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include <pthread.h>
#include <unistd.h>

#include <fmt/core.h>

#include "gif_maker/config.hpp"
#include "gif_maker/logging.hpp"
#include "gif_maker/progress_parser.hpp"

namespace gif_maker {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// FFmpeg's interactive quit key
constexpr const char *QUIT_COMMAND = "q";

/// Read size for the GIF stream
constexpr size_t STDOUT_CHUNK_SIZE = 64 * 1024;

/// Protocol inputs (http://..., pipe:3, concat:a|b, file:x) are handed to
/// FFmpeg unchecked. A single letter before ':' is a drive, not a scheme.
bool is_local_path(const std::string &path) {
  size_t colon = path.find(':');
  if (colon == std::string::npos || colon < 2)
    return true;
  if (!std::isalpha(static_cast<unsigned char>(path[0])))
    return true;
  for (size_t i = 1; i < colon; ++i) {
    unsigned char c = static_cast<unsigned char>(path[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
      return true;
  }
  return false;
}

std::string join_lines(const std::deque<std::string> &lines) {
  std::string joined;
  for (const auto &line : lines) {
    if (!joined.empty())
      joined += '\n';
    joined += line;
  }
  return joined;
}

std::string render_command(const std::string &program,
                           const std::vector<std::string> &args) {
  std::string cmd = program;
  for (const auto &arg : args) {
    cmd += fmt::format(" '{}'", arg);
  }
  return cmd;
}

} // anonymous namespace

// **---- Converter ----**

Converter::Converter()
    : messages_(std::make_shared<MessageChannel>()),
      commands_(std::make_shared<CommandChannel>()),
      grace_(Config::cancel_grace_ms()) {}

void Converter::fail_before_start(Error error) {
  LOG_ERROR("{}", error.describe());
  messages_->send(Message::failure(std::move(error)));
  messages_->send(Message::done());
}

void Converter::convert(const Settings &settings) {
  if (used_.exchange(true)) {
    fail_before_start(Error::spawn_failed("converter already used"));
    return;
  }

  TIMER_START(convert_job);

  const std::string &input = settings.video_path();
  if (is_local_path(input)) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
      fail_before_start(
          Error::spawn_failed(fmt::format("input not found: {}", input)));
      return;
    }
  }

  std::string program = settings.ffmpeg_binary();
  std::vector<std::string> args = settings.ffmpeg_args();

  LOG_INFO("Converting {} (width {}, {} fps)",
           fs::path(input).filename().string(), settings.gif_width(),
           settings.gif_fps());
  LOG_DEBUG("Command: {}", render_command(program, args));

  /// Spawn failures are reported before any worker exists
  ChildProcess child;
  std::string spawn_error;
  if (!child.spawn(program, args, spawn_error)) {
    fail_before_start(Error::spawn_failed(spawn_error));
    return;
  }

  JobOutcome outcome;
  std::atomic<bool> process_exited{false};
  std::atomic<bool> cancelled{false};

  std::thread stdout_worker(&Converter::read_stdout, this, std::ref(child),
                            std::ref(outcome.out));
  std::thread stderr_worker(&Converter::read_stderr, this, std::ref(child),
                            std::ref(outcome.err));
  std::thread cancel_worker(&Converter::control_cancellation, this,
                            std::ref(child), std::cref(process_exited),
                            std::ref(cancelled));

  outcome.status_known = child.wait_exit(outcome.status, outcome.wait_error);

  /// Release the cancel worker if no command ever arrived
  process_exited.store(true);
  commands_->wake_all();

  cancel_worker.join();
  stdout_worker.join();
  stderr_worker.join();

  /// Nobody signals the pid anymore
  child.reap();

  outcome.cancelled = cancelled.load();
  messages_->send(reconcile(std::move(outcome)));
  messages_->send(Message::done());

  TIMER_END(convert_job);
}

// **---- Workers ----**

void Converter::read_stdout(ChildProcess &child, StdoutResult &result) {
  std::vector<uint8_t> chunk(STDOUT_CHUNK_SIZE);
  int fd = child.stdout_fd();

  while (true) {
    ssize_t n = ::read(fd, chunk.data(), chunk.size());
    if (n > 0) {
      result.data.insert(result.data.end(), chunk.begin(), chunk.begin() + n);
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      result.io_failed = true;
      result.error = std::system_category().message(errno);
      LOG_ERROR("Reading ffmpeg stdout failed: {}", result.error);
      /// Nobody drains the pipe anymore, so FFmpeg could block forever
      child.kill();
      break;
    }
  }

  LOG_DEBUG("stdout closed after {} bytes", result.data.size());
}

void Converter::read_stderr(ChildProcess &child, StderrResult &result) {
  ProgressParser parser;
  LineBuffer line_buffer;
  std::vector<char> chunk(static_cast<size_t>(Config::stderr_chunk_size()));
  std::vector<std::string> lines;
  std::vector<Message> events;
  const size_t tail_limit = static_cast<size_t>(Config::stderr_tail_lines());
  int fd = child.stderr_fd();

  auto dispatch = [&] {
    for (auto &line : lines) {
      parser.feed_line(line, events);
      if (tail_limit > 0) {
        if (result.tail.size() == tail_limit)
          result.tail.pop_front();
        result.tail.push_back(std::move(line));
      }
    }
    lines.clear();
    for (auto &event : events) {
      messages_->send(std::move(event));
    }
    events.clear();
  };

  while (true) {
    ssize_t n = ::read(fd, chunk.data(), chunk.size());
    if (n > 0) {
      line_buffer.append(chunk.data(), static_cast<size_t>(n), lines);
      dispatch();
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      result.io_failed = true;
      result.error = std::system_category().message(errno);
      LOG_ERROR("Reading ffmpeg stderr failed: {}", result.error);
      child.kill();
      break;
    }
  }

  line_buffer.finish(lines);
  dispatch();

  if (!parser.duration()) {
    LOG_DEBUG("No duration found in ffmpeg diagnostics");
  }
}

void Converter::control_cancellation(ChildProcess &child,
                                     const std::atomic<bool> &process_exited,
                                     std::atomic<bool> &cancelled) {
  /// Writing to an exited FFmpeg must yield EPIPE, not kill the host process.
  /// The signal stays pending on this thread and dies with it.
  sigset_t pipe_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &pipe_set, nullptr);

  std::optional<Command> command = commands_->recv_unless(process_exited);
  if (!command) {
    LOG_DEBUG("Process exited without cancellation");
    return;
  }

  if (child.has_exited()) {
    LOG_DEBUG("Cancel arrived after process exit, ignored");
    return;
  }

  LOG_INFO("Cancellation requested, asking ffmpeg to quit");
  std::string error;
  if (!child.write_stdin(QUIT_COMMAND, error)) {
    if (child.has_exited()) {
      LOG_DEBUG("Process exited before the quit command: {}", error);
      return;
    }
    LOG_WARN("Quit command refused ({}), killing ffmpeg", error);
    if (child.kill()) {
      cancelled.store(true);
    }
    return;
  }
  cancelled.store(true);

  if (!child.wait_exited_for(grace_)) {
    LOG_WARN("ffmpeg ignored the quit command for {} ms, killing it",
             grace_.count());
    child.kill();
  }
}

// **---- Reconciliation ----**

Message reconcile(JobOutcome outcome) {
  const StdoutResult &out = outcome.out;
  const StderrResult &err = outcome.err;
  const ExitStatus &status = outcome.status;
  Error error;

  if (outcome.cancelled) {
    if (!out.data.empty()) {
      LOG_DEBUG("Discarding {} partial bytes of a cancelled job",
                out.data.size());
    }
    error = Error::cancelled();
  } else if (out.io_failed) {
    error = Error::stream_io(fmt::format("stdout: {}", out.error));
  } else if (err.io_failed) {
    error = Error::stream_io(fmt::format("stderr: {}", err.error));
  } else if (out.data.empty()) {
    error = Error::empty_stdout(join_lines(err.tail));
  } else if (!outcome.status_known) {
    error = Error::process_failed(-1, 0, outcome.wait_error);
  } else if (!status.success()) {
    error = Error::process_failed(status.code, status.signal,
                                  join_lines(err.tail));
  } else {
    LOG_SUCCESS("Conversion finished: {} bytes", out.data.size());
    return Message::success(std::move(outcome.out.data));
  }

  if (error.kind == ErrorKind::Cancelled) {
    LOG_WARN("{}", error.describe());
  } else {
    LOG_ERROR("{}", error.describe());
  }
  return Message::failure(std::move(error));
}

} // namespace gif_maker
