/**
 * @file settings.cpp
 * @brief Settings and FFmpeg command line implementation
 */

#include "gif_maker/settings.hpp"

#include <utility>

#include <fmt/core.h>

#include "gif_maker/config.hpp"

namespace gif_maker {

Settings::Settings(std::string video_path, uint16_t width, uint16_t fps)
    : video_path_(std::move(video_path)),
      gif_fps_(fps == 0 ? STANDARD_FPS : fps), gif_width_(width) {}

Settings Settings::with_standard_fps(std::string video_path, uint16_t width) {
  return Settings(std::move(video_path), width, STANDARD_FPS);
}

Settings Settings::with_fps(std::string video_path, uint16_t width,
                            uint16_t fps) {
  return Settings(std::move(video_path), width, fps);
}

Settings Settings::ffmpeg_path(std::string path) const {
  Settings copy = *this;
  copy.ffmpeg_path_ = std::move(path);
  return copy;
}

std::string Settings::filter_complex() const {
  return fmt::format("fps={},scale={}:-1[s]; [s]split[a][b]; "
                     "[a]palettegen[palette]; [b][palette]paletteuse",
                     gif_fps_, gif_width_);
}

std::string Settings::ffmpeg_binary() const {
  if (ffmpeg_path_ && !ffmpeg_path_->empty())
    return *ffmpeg_path_;
  return Config::ffmpeg_path();
}

std::vector<std::string> Settings::ffmpeg_args() const {
  return {"-stats", "-i", video_path_, "-filter_complex", filter_complex(),
          "-f",     "gif", "-"};
}

} // namespace gif_maker
