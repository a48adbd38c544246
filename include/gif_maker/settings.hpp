/**
 * @file settings.hpp
 * @brief Conversion job settings and FFmpeg command line construction
 *
 * @details Settings is the immutable description of one job. Translating it
 *          into FFmpeg arguments is a pure function; nothing here touches the
 *          filesystem or spawns anything.
 */

#ifndef GIF_MAKER_SETTINGS_HPP
#define GIF_MAKER_SETTINGS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gif_maker {

/**
 * @class Settings
 * @brief Input path, GIF width, frame-rate policy and optional FFmpeg path.
 */
class Settings {
public:
  /// Frame rate used unless a custom one is requested
  static constexpr uint16_t STANDARD_FPS = 10;

  /**
   * @brief Settings using STANDARD_FPS.
   * @param video_path Source video (local path or any URL FFmpeg accepts)
   * @param width Output GIF width in pixels, height follows aspect ratio
   */
  static Settings with_standard_fps(std::string video_path, uint16_t width);

  /**
   * @brief Settings with a custom frame rate.
   * @note fps == 0 falls back to STANDARD_FPS.
   */
  static Settings with_fps(std::string video_path, uint16_t width,
                           uint16_t fps);

  /**
   * @brief Copy of these settings using @p path as the FFmpeg binary.
   */
  Settings ffmpeg_path(std::string path) const;

  const std::string &video_path() const { return video_path_; }
  uint16_t gif_width() const { return gif_width_; }
  uint16_t gif_fps() const { return gif_fps_; }
  const std::optional<std::string> &ffmpeg_path_override() const {
    return ffmpeg_path_;
  }

  /**
   * @brief Value of FFmpeg's -filter_complex flag.
   * @note Two-pass palette generation keeps GIF colors close to the source.
   */
  std::string filter_complex() const;

  /**
   * @brief Binary to execute: override, else FFMPEG_PATH, else "ffmpeg".
   */
  std::string ffmpeg_binary() const;

  /**
   * @brief Full argument vector (without argv[0]).
   * @note Output goes to stdout ("-f gif -"); -stats keeps the progress
   *       line on stderr even when stderr is not a terminal.
   */
  std::vector<std::string> ffmpeg_args() const;

private:
  Settings(std::string video_path, uint16_t width, uint16_t fps);

  std::optional<std::string> ffmpeg_path_;
  std::string video_path_;
  uint16_t gif_fps_;
  uint16_t gif_width_;
};

} // namespace gif_maker

#endif // GIF_MAKER_SETTINGS_HPP
