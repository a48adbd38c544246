/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values passed explicitly (Settings::ffmpeg_path,
 *          Converter::set_cancel_grace) take precedence over these.
 */

#ifndef GIF_MAKER_CONFIG_HPP
#define GIF_MAKER_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace gif_maker {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/// FFmpeg binary used when Settings carries no override
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Bytes requested per read() on the diagnostic pipe.
 * @note Lines are reassembled across chunks, so this only trades syscalls
 *       against latency of progress events.
 */
inline int stderr_chunk_size() {
  static int val = get_env_int("STDERR_CHUNK_SIZE", 1000);
  return val > 0 ? val : 1000;
}

/// Diagnostic lines kept for the ProcessFailed error detail
inline int stderr_tail_lines() {
  static int val = get_env_int("STDERR_TAIL_LINES", 10);
  return val >= 0 ? val : 10;
}

/**
 * @brief Milliseconds FFmpeg gets to honor the quit command before SIGKILL.
 */
inline int cancel_grace_ms() {
  static int val = get_env_int("CANCEL_GRACE_MS", 5000);
  return val >= 0 ? val : 5000;
}

/// Enable LOG_DEBUG output
inline bool debug_logging() {
  static bool val = (get_env_int("LOG_DEBUG", 0) != 0);
  return val;
}

} // namespace Config
} // namespace gif_maker

#endif // GIF_MAKER_CONFIG_HPP
