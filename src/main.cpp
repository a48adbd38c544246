/**
 * @file main.cpp
 * @brief Entry point for the GIF Maker command line tool
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Running one conversion job on a worker thread
 *
 *          - Rendering duration/progress events
 *
 *          - Forwarding SIGINT/SIGTERM as a cancellation request
 *
 * @note Signals are blocked in every thread and consumed by a dedicated
 *       sigwait() thread.
 */

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

#include <fmt/core.h>

#include "gif_maker/converter.hpp"
#include "gif_maker/logging.hpp"
#include "gif_maker/settings.hpp"

using namespace gif_maker;

namespace {

constexpr uint16_t DEFAULT_WIDTH = 480;

/// Parse a positive 16-bit CLI argument
bool parse_u16(const char *arg, uint16_t &out) {
  char *end = nullptr;
  errno = 0;
  long v = std::strtol(arg, &end, 10);
  if (errno != 0 || !end || *end != '\0' || v <= 0 || v > 65535)
    return false;
  out = static_cast<uint16_t>(v);
  return true;
}

std::string format_millis(Millis d) {
  long long total = d.count();
  long long h = total / 3600000;
  long long m = (total % 3600000) / 60000;
  long long s = (total % 60000) / 1000;
  long long ms = total % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

bool write_file(const std::string &path, const std::vector<uint8_t> &data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f)
    return false;
  f.write(reinterpret_cast<const char *>(data.data()),
          static_cast<std::streamsize>(data.size()));
  return f.good();
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  if (argc < 3 || argc > 5) {
    LOG_WARN("Usage: ./gif_maker <input> <output.gif> [width={}] [fps={}]",
             DEFAULT_WIDTH, Settings::STANDARD_FPS);
    return 1;
  }

  std::string input_arg = argv[1];
  std::string output_arg = argv[2];
  uint16_t width = DEFAULT_WIDTH;
  uint16_t fps = Settings::STANDARD_FPS;

  if (argc > 3 && !parse_u16(argv[3], width)) {
    LOG_ERROR("Invalid width: {}", argv[3]);
    return 1;
  }
  if (argc > 4 && !parse_u16(argv[4], fps)) {
    LOG_ERROR("Invalid fps: {}", argv[4]);
    return 1;
  }

  /// Block termination signals before any thread exists so all inherit it
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGUSR1);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  LOG_PHASE("================== GIF MAKER ==================");
  LOG_INFO("Input: {}", input_arg);
  LOG_INFO("Output: {}", output_arg);
  LOG_INFO("Width: {} px, {} fps", width, fps);

  Settings settings = Settings::with_fps(input_arg, width, fps);
  Converter converter;
  auto messages = converter.messages();
  auto commands = converter.commands();

  /// SIGINT/SIGTERM -> Command::Cancel; SIGUSR1 -> job over, stop listening
  std::thread signal_listener([&signals, commands]() {
    int sig = 0;
    while (sigwait(&signals, &sig) == 0) {
      if (sig == SIGUSR1)
        return;
      LOG_WARN("Received signal {}, cancelling conversion", sig);
      commands->send(Command::Cancel);
    }
  });

  std::thread job([&converter, &settings]() { converter.convert(settings); });

  int exit_code = 0;
  bool done = false;
  while (!done) {
    Message msg = messages->recv();
    switch (msg.type) {
    case MessageType::VideoDuration:
      LOG_INFO("Video duration: {}", format_millis(msg.duration));
      break;
    case MessageType::Progress:
      LOG_INFO("Progress: {:.1f} %", msg.progress * 100.0);
      break;
    case MessageType::Success:
      if (write_file(output_arg, msg.data)) {
        LOG_SUCCESS("Wrote {} ({} bytes)",
                    std::filesystem::path(output_arg).filename().string(),
                    msg.data.size());
      } else {
        LOG_ERROR("Failed to write {}", output_arg);
        exit_code = 1;
      }
      break;
    case MessageType::Error:
      LOG_ERROR("[{}] {}", to_string(msg.error.kind), msg.error.describe());
      /// Stderr tail of a run that got far enough to print diagnostics
      if ((msg.error.kind == ErrorKind::EmptyStdout ||
           msg.error.kind == ErrorKind::ProcessFailed) &&
          !msg.error.detail.empty()) {
        LOG_ERROR("{}", msg.error.detail);
      }
      exit_code = msg.error.kind == ErrorKind::Cancelled ? 130 : 1;
      break;
    case MessageType::Done:
      done = true;
      break;
    }
  }

  job.join();
  pthread_kill(signal_listener.native_handle(), SIGUSR1);
  signal_listener.join();

  TimingCollector::print_summary();
  TimingCollector::clear();
  return exit_code;
}
