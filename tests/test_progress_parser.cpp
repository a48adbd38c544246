/**
 * @file test_progress_parser.cpp
 * @brief Tests for FFmpeg diagnostic parsing
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "gif_maker/progress_parser.hpp"

using namespace gif_maker;

namespace {

const char *INPUT_HEADER =
    "Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'assets/flower.mp4':\n"
    "  Metadata:\n"
    "    major_brand     : mp42\n"
    "    minor_version   : 0\n"
    "    compatible_brands: mp42mp41isomavc1\n"
    "    creation_time   : 2018-03-07T15:21:21.000000Z\n"
    "  Duration: 00:00:05.06, start: 0.000000, bitrate: 1785 kb/s\n"
    "  Stream #0:0[0x1](und): Video: h264 (High) (avc1 / 0x31637661), "
    "yuv420p(tv, smpte170m, progressive), 960x540 [SAR 1:1 DAR 16:9], "
    "1538 kb/s, 29.97 fps, 29.97 tbr, 30k tbn (default)\n";

std::vector<std::string> split(const std::string &text, size_t chunk) {
  LineBuffer buffer;
  std::vector<std::string> lines;
  for (size_t i = 0; i < text.size(); i += chunk) {
    std::string part = text.substr(i, chunk);
    buffer.append(part.data(), part.size(), lines);
  }
  buffer.finish(lines);
  return lines;
}

} // namespace

// **---- parse_ffmpeg_time ----**

TEST(ParseFfmpegTime, CentisecondsScaleToMilliseconds) {
  auto t = parse_ffmpeg_time("00:00:04.91");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 4910);
}

TEST(ParseFfmpegTime, AllFieldsContribute) {
  auto t = parse_ffmpeg_time("01:02:03.456");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), ((1 * 60 + 2) * 60 + 3) * 1000 + 456);
}

TEST(ParseFfmpegTime, ExtraFractionDigitsTruncate) {
  auto t = parse_ffmpeg_time("00:00:01.123456");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 1123);
}

TEST(ParseFfmpegTime, FractionIsOptional) {
  auto t = parse_ffmpeg_time("00:01:00");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 60000);
}

TEST(ParseFfmpegTime, HoursMayExceedTwoDigits) {
  auto t = parse_ffmpeg_time("100:00:00.00");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 100LL * 3600 * 1000);
}

TEST(ParseFfmpegTime, RejectsMalformedInput) {
  EXPECT_FALSE(parse_ffmpeg_time("N/A"));
  EXPECT_FALSE(parse_ffmpeg_time(""));
  EXPECT_FALSE(parse_ffmpeg_time("-00:00:00.05"));
  EXPECT_FALSE(parse_ffmpeg_time("00:60:00.00"));
  EXPECT_FALSE(parse_ffmpeg_time("00:00:60.00"));
  EXPECT_FALSE(parse_ffmpeg_time("00:00.50"));
  EXPECT_FALSE(parse_ffmpeg_time("00:00:01."));
  EXPECT_FALSE(parse_ffmpeg_time("00:00:0a.00"));
  EXPECT_FALSE(parse_ffmpeg_time("00:00:00:01.00"));
}

// **---- Marker extraction ----**

TEST(TryExtractDuration, FindsInputDuration) {
  auto d = try_extract_duration(
      "  Duration: 00:00:05.06, start: 0.000000, bitrate: 1785 kb/s");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->count(), 5060);
}

TEST(TryExtractDuration, IgnoresOtherLines) {
  EXPECT_FALSE(try_extract_duration("    major_brand     : mp42"));
  EXPECT_FALSE(try_extract_duration("  Duration: N/A, bitrate: N/A"));
  EXPECT_FALSE(
      try_extract_duration("    title           : Duration: 00:00:01.00"));
}

TEST(TryExtractFrameTime, FindsStatsTime) {
  auto t = try_extract_frame_time(
      "frame=   50 fps=3.9 q=-0.0 Lsize=   23430kB time=00:00:04.91 "
      "bitrate=39091.3kbits/s speed=0.379x    ");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 4910);
}

TEST(TryExtractFrameTime, ToleratesFormatDrift) {
  /// Newer FFmpeg prints elapsed= after time= and may omit frame=
  auto t = try_extract_frame_time(
      "size=     256KiB time=00:00:01.50 bitrate=1398.1kbits/s speed=3.01x "
      "elapsed=0:00:00.50");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->count(), 1500);
}

TEST(TryExtractFrameTime, IgnoresUnknownTimes) {
  EXPECT_FALSE(try_extract_frame_time("frame=    0 fps=0.0 q=0.0 size=0kB "
                                      "time=N/A bitrate=N/A speed=N/A"));
  EXPECT_FALSE(try_extract_frame_time("out_time=00:00:01.000000"));
  EXPECT_FALSE(try_extract_frame_time("Stream mapping:"));
}

TEST(ProgressFromDurations, CapsAtOne) {
  EXPECT_DOUBLE_EQ(progress_from_durations(Millis(2000), Millis(500)), 0.25);
  EXPECT_DOUBLE_EQ(progress_from_durations(Millis(2000), Millis(5000)), 1.0);
  EXPECT_DOUBLE_EQ(progress_from_durations(Millis(0), Millis(10)), 1.0);
}

// **---- LineBuffer ----**

TEST(LineBuffer, ReassemblesAcrossChunkBoundaries) {
  std::string text = std::string(INPUT_HEADER) +
                     "frame=   1 time=00:00:01.00 bitrate=N/A\r"
                     "frame=   2 time=00:00:02.00 bitrate=N/A\r\n"
                     "trailing without newline";
  for (size_t chunk : {1u, 7u, 1000u}) {
    auto lines = split(text, chunk);
    ASSERT_EQ(lines.size(), 11u) << "chunk=" << chunk;
    EXPECT_EQ(lines[6],
              "  Duration: 00:00:05.06, start: 0.000000, bitrate: 1785 kb/s");
    EXPECT_EQ(lines[8], "frame=   1 time=00:00:01.00 bitrate=N/A");
    EXPECT_EQ(lines[10], "trailing without newline");
  }
}

// **---- ProgressParser ----**

TEST(ProgressParser, DurationThenProgress) {
  ProgressParser parser;
  std::vector<Message> events;
  for (const auto &line : split(INPUT_HEADER, 1000)) {
    parser.feed_line(line, events);
  }
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, MessageType::VideoDuration);
  EXPECT_EQ(events[0].duration.count(), 5060);

  events.clear();
  parser.feed_line("frame=   25 fps=0.0 time=00:00:02.53 bitrate=N/A", events);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, MessageType::Progress);
  EXPECT_DOUBLE_EQ(events[0].progress, 0.5);
}

TEST(ProgressParser, DurationReportedOnce) {
  ProgressParser parser;
  std::vector<Message> events;
  parser.feed_line("  Duration: 00:00:10.00, start: 0.000000", events);
  parser.feed_line("  Duration: 00:00:20.00, start: 0.000000", events);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(parser.duration()->count(), 10000);
}

TEST(ProgressParser, TimeBeforeDurationIsIgnored) {
  ProgressParser parser;
  std::vector<Message> events;
  parser.feed_line("frame=1 time=00:00:01.00", events);
  EXPECT_TRUE(events.empty());
  EXPECT_FALSE(parser.last_progress().has_value());
}

TEST(ProgressParser, ProgressNeverDecreasesOrRepeats) {
  ProgressParser parser;
  std::vector<Message> events;
  parser.feed_line("  Duration: 00:00:02.00, start: 0.000000", events);
  events.clear();

  for (const char *t : {"00:00:01.50", "00:00:00.50", "00:00:01.50",
                        "00:00:02.00", "00:00:03.00"}) {
    parser.feed_line(std::string("frame=1 time=") + t, events);
  }

  ASSERT_EQ(events.size(), 2u);
  EXPECT_DOUBLE_EQ(events[0].progress, 0.75);
  EXPECT_DOUBLE_EQ(events[1].progress, 1.0);
}

TEST(ProgressParser, ResetForgetsState) {
  ProgressParser parser;
  std::vector<Message> events;
  parser.feed_line("  Duration: 00:00:02.00, start: 0.000000", events);
  parser.feed_line("frame=1 time=00:00:02.00", events);
  parser.reset();
  EXPECT_FALSE(parser.duration().has_value());
  EXPECT_FALSE(parser.last_progress().has_value());
}
