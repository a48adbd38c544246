/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime gated LOG_DEBUG (LOG_DEBUG=1 in the environment)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating job durations
 *
 * @note All logs go to stderr via fmt::print and are flushed immediately.
 *       stdout is left untouched so the CLI can be used in pipelines.
 */

#ifndef GIF_MAKER_LOGGING_HPP
#define GIF_MAKER_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace gif_maker {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                    \
    fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);              \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (gif_maker::Config::debug_logging()) {                                  \
      std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                  \
      fmt::print(stderr, fg(fmt::color::gray), "[DEBUG] " format_str "\n",     \
                 ##__VA_ARGS__);                                               \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);  \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(gif_maker::log_mutex);                    \
    fmt::print(stderr, fg(fmt::color::green), format_str "\n", ##__VA_ARGS__); \
    std::fflush(stderr);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Job or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe store of timing measurements.
 * @note Jobs running on different threads record here concurrently.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a table on stderr.
   */
  static void print_summary();

  /// Copy of the current entries
  static std::vector<TimingEntry> snapshot();

  /**
   * @brief Drop all entries.
   * @note Every job appends one entry; long-lived hosts call this after
   *       reading a summary.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    gif_maker::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace gif_maker

#endif // GIF_MAKER_LOGGING_HPP
