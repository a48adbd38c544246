/**
 * @file progress_parser.hpp
 * @brief Extraction of duration and progress from FFmpeg diagnostics
 *
 * @details FFmpeg's stderr is human-readable text whose exact shape drifts
 *          between versions. Two markers are recognized:
 *
 *          - "  Duration: 00:00:05.06, start: 0.000000, bitrate: ..." in the
 *            input description
 *
 *          - "frame=   50 fps=3.9 ... time=00:00:04.91 bitrate=..." on the
 *            stats line, rewritten in place with '\r'
 *
 *          Anything else is ignored.
 */

#ifndef GIF_MAKER_PROGRESS_PARSER_HPP
#define GIF_MAKER_PROGRESS_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace gif_maker {

// **---- Marker extraction ----**

/**
 * @brief Parse an FFmpeg timestamp "HH:MM:SS[.fff]".
 * @note Hours may have any number of digits; minutes and seconds must be
 *       below 60. Fraction digits beyond milliseconds are truncated.
 * @return Parsed duration, or std::nullopt for "N/A", negative or malformed
 *         input
 */
std::optional<Millis> parse_ffmpeg_time(std::string_view s);

/**
 * @brief Source duration from a "Duration: ..." line.
 */
std::optional<Millis> try_extract_duration(std::string_view line);

/**
 * @brief Elapsed output time from a stats line ("time=...").
 * @note The last "time=" token on the line wins.
 */
std::optional<Millis> try_extract_frame_time(std::string_view line);

/**
 * @brief processed / total, capped at 1.0.
 * @note A zero total reports 1.0.
 */
double progress_from_durations(Millis total, Millis processed);

// **---- Line assembly ----**

/**
 * @class LineBuffer
 * @brief Reassembles lines from arbitrarily split read() chunks.
 * @note Both '\n' and '\r' terminate a line; empty lines are dropped.
 */
class LineBuffer {
public:
  /**
   * @brief Append a chunk and move every completed line into @p lines.
   */
  void append(const char *data, size_t n, std::vector<std::string> &lines);

  /**
   * @brief Flush the trailing partial line, if any (end of stream).
   */
  void finish(std::vector<std::string> &lines);

private:
  std::string pending_;
};

// **---- Parser ----**

/**
 * @class ProgressParser
 * @brief Per-job ProgressState plus the rules turning lines into events.
 *
 * @attention RULES:
 *
 *   - The first Duration marker sets the total and yields VideoDuration once
 *
 *   - time= markers yield Progress once a total is known, clamped to
 *     [last emitted, 1.0] and only when the value changed
 *
 *   - time= markers before any Duration are ignored
 */
class ProgressParser {
public:
  /**
   * @brief Apply one diagnostic line, appending resulting events to @p out.
   */
  void feed_line(std::string_view line, std::vector<Message> &out);

  const std::optional<Millis> &duration() const { return duration_; }
  const std::optional<double> &last_progress() const { return last_progress_; }

  /// Forget everything; used at job start
  void reset();

private:
  std::optional<Millis> duration_;
  std::optional<double> last_progress_;
};

} // namespace gif_maker

#endif // GIF_MAKER_PROGRESS_PARSER_HPP
