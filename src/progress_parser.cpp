/**
 * @file progress_parser.cpp
 * @brief FFmpeg diagnostic parsing implementation
 *
 * @details Verified against the stats output of FFmpeg 4.x to 7.x. Newer
 *          versions that change the markers only lose progress events; the
 *          conversion itself is unaffected.
 */

#include "gif_maker/progress_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "gif_maker/logging.hpp"

namespace gif_maker {

// **---- Internal Helpers ----**

namespace {

/// Parse a non-empty run of ASCII digits (at most 9, no overflow)
bool parse_digits(std::string_view s, uint64_t &out) {
  if (s.empty() || s.size() > 9)
    return false;
  uint64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  out = v;
  return true;
}

std::string_view trim_left(std::string_view s) {
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  return s.substr(i);
}

/// Token up to the first whitespace or ','
std::string_view take_token(std::string_view s) {
  size_t end = 0;
  while (end < s.size() && s[end] != ',' &&
         !std::isspace(static_cast<unsigned char>(s[end])))
    ++end;
  return s.substr(0, end);
}

} // anonymous namespace

// **---- Marker extraction ----**

std::optional<Millis> parse_ffmpeg_time(std::string_view s) {
  std::string_view whole = s;
  std::string_view fraction;
  size_t dot = s.find('.');
  if (dot != std::string_view::npos) {
    whole = s.substr(0, dot);
    fraction = s.substr(dot + 1);
    if (fraction.empty())
      return std::nullopt;
  }

  size_t c1 = whole.find(':');
  if (c1 == std::string_view::npos)
    return std::nullopt;
  size_t c2 = whole.find(':', c1 + 1);
  if (c2 == std::string_view::npos ||
      whole.find(':', c2 + 1) != std::string_view::npos)
    return std::nullopt;

  uint64_t hours = 0, minutes = 0, seconds = 0;
  if (!parse_digits(whole.substr(0, c1), hours) ||
      !parse_digits(whole.substr(c1 + 1, c2 - c1 - 1), minutes) ||
      !parse_digits(whole.substr(c2 + 1), seconds))
    return std::nullopt;
  if (minutes >= 60 || seconds >= 60)
    return std::nullopt;

  /// ".9" -> 900ms, ".91" -> 910ms, ".912345" -> 912ms
  uint64_t millis = 0;
  if (!fraction.empty()) {
    std::string_view ms_digits = fraction.substr(0, 3);
    uint64_t rest = 0;
    if (!parse_digits(ms_digits, millis) ||
        (fraction.size() > 3 && !parse_digits(fraction.substr(3, 9), rest)))
      return std::nullopt;
    for (size_t i = ms_digits.size(); i < 3; ++i)
      millis *= 10;
  }

  uint64_t total = millis + seconds * 1000 + minutes * 60 * 1000 +
                   hours * 60 * 60 * 1000;
  return Millis(static_cast<Millis::rep>(total));
}

std::optional<Millis> try_extract_duration(std::string_view line) {
  static constexpr std::string_view MARKER = "Duration:";

  std::string_view body = trim_left(line);
  if (body.substr(0, MARKER.size()) != MARKER)
    return std::nullopt;

  std::string_view token = take_token(trim_left(body.substr(MARKER.size())));
  auto d = parse_ffmpeg_time(token);
  if (!d) {
    LOG_DEBUG("Unparsable duration '{}'", token);
  }
  return d;
}

std::optional<Millis> try_extract_frame_time(std::string_view line) {
  static constexpr std::string_view MARKER = "time=";

  /// Scan backwards so a line carrying two stats updates yields the newest
  size_t pos = line.rfind(MARKER);
  while (pos != std::string_view::npos) {
    bool at_word_start =
        pos == 0 || std::isspace(static_cast<unsigned char>(line[pos - 1]));
    if (at_word_start) {
      std::string_view token =
          take_token(trim_left(line.substr(pos + MARKER.size())));
      return parse_ffmpeg_time(token);
    }
    if (pos == 0)
      break;
    pos = line.rfind(MARKER, pos - 1);
  }
  return std::nullopt;
}

double progress_from_durations(Millis total, Millis processed) {
  if (total.count() <= 0)
    return 1.0;
  double fraction = static_cast<double>(processed.count()) /
                    static_cast<double>(total.count());
  return std::clamp(fraction, 0.0, 1.0);
}

// **---- LineBuffer ----**

void LineBuffer::append(const char *data, size_t n,
                        std::vector<std::string> &lines) {
  for (size_t i = 0; i < n; ++i) {
    char c = data[i];
    if (c == '\n' || c == '\r') {
      if (!pending_.empty()) {
        lines.push_back(std::move(pending_));
        pending_.clear();
      }
    } else {
      pending_.push_back(c);
    }
  }
}

void LineBuffer::finish(std::vector<std::string> &lines) {
  if (!pending_.empty()) {
    lines.push_back(std::move(pending_));
    pending_.clear();
  }
}

// **---- ProgressParser ----**

void ProgressParser::feed_line(std::string_view line,
                               std::vector<Message> &out) {
  if (!duration_) {
    if (auto d = try_extract_duration(line)) {
      duration_ = *d;
      LOG_DEBUG("Source duration: {} ms", d->count());
      out.push_back(Message::video_duration(*d));
      return;
    }
  }

  auto time = try_extract_frame_time(line);
  if (!time)
    return;
  if (!duration_) {
    LOG_DEBUG("time={} ms seen before any duration, ignored", time->count());
    return;
  }

  double floor = last_progress_.value_or(0.0);
  double fraction =
      std::clamp(progress_from_durations(*duration_, *time), floor, 1.0);
  if (last_progress_ && *last_progress_ == fraction)
    return;

  last_progress_ = fraction;
  out.push_back(Message::progress_update(fraction));
}

void ProgressParser::reset() {
  duration_.reset();
  last_progress_.reset();
}

} // namespace gif_maker
