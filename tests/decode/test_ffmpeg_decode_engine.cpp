// Repository: RetroVue-clipshard
// Component: FFmpeg decode engine tests
//
// Tests that need a real clip read its path from CLIPSHARD_TEST_VIDEO and are
// skipped when it is unset.

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "clipshard/decode/FFmpegDecodeEngine.hpp"
#include "clipshard/decode/FFmpegDecoder.hpp"
#include "fixtures/TempDir.h"

namespace fs = std::filesystem;

namespace clipshard::decode {
namespace {

using tests::fixtures::TempDir;
using tests::fixtures::WriteFileText;

constexpr chunking::Dimensions kSmall{32, 24};

std::string TestVideoPath() {
  const char* path = std::getenv("CLIPSHARD_TEST_VIDEO");
  return path ? path : "";
}

DecodeRequest MakeRequest(const std::string& path, int fps = 8) {
  DecodeRequest request;
  request.input_path = path;
  request.fps = fps;
  request.dims = kSmall;
  return request;
}

TEST(FFmpegDecoderTest, OpenFailsForMissingFile) {
  DecoderConfig config;
  config.input_uri = "/nonexistent/clip.mp4";
  FFmpegDecoder decoder(config);
  EXPECT_FALSE(decoder.Open());
  EXPECT_FALSE(decoder.IsOpen());
  EXPECT_FALSE(decoder.LastError().empty());
}

TEST(FFmpegDecodeEngineTest, NonexistentInputFails) {
  FFmpegDecodeEngine engine;
  DecodeResult raw = engine.DecodeRaw(MakeRequest("/nonexistent/clip.mp4"));
  EXPECT_FALSE(raw.ok);
  EXPECT_EQ(raw.error.rfind("error extracting raw frames: ", 0), 0u) << raw.error;
  EXPECT_TRUE(raw.frames.raw.empty());

  TempDir tmp("decode");
  DecodeResult images = engine.DecodeToImages(MakeRequest("/nonexistent/clip.mp4"),
                                              tmp.path());
  EXPECT_FALSE(images.ok);
  EXPECT_EQ(images.error.rfind("error extracting jpeg frames: ", 0), 0u) << images.error;
  EXPECT_TRUE(fs::is_empty(tmp.path()));
}

TEST(FFmpegDecodeEngineTest, GarbageInputFails) {
  TempDir tmp("decode");
  const std::string path = tmp.Join("garbage.mp4");
  WriteFileText(path, std::string(4096, 'G'));

  FFmpegDecodeEngine engine;
  EXPECT_FALSE(engine.DecodeRaw(MakeRequest(path)).ok);
}

TEST(FFmpegDecodeEngineTest, NonPositiveFpsFails) {
  FFmpegDecodeEngine engine;
  DecodeResult result = engine.DecodeRaw(MakeRequest("/nonexistent/clip.mp4", 0));
  EXPECT_FALSE(result.ok);
}

TEST(FFmpegDecodeEngineTest, RawDecodeProducesWholeRgbFrames) {
  const std::string video = TestVideoPath();
  if (video.empty()) {
    GTEST_SKIP() << "CLIPSHARD_TEST_VIDEO not set";
  }

  FFmpegDecodeEngine engine;
  DecodeResult result = engine.DecodeRaw(MakeRequest(video));
  ASSERT_TRUE(result.ok) << result.error;
  ASSERT_FALSE(result.frames.raw.empty());
  EXPECT_EQ(result.frames.raw.size() % static_cast<size_t>(kSmall.FrameBytes()), 0u);
  EXPECT_GT(result.source_fps, 0);
}

TEST(FFmpegDecodeEngineTest, TargetRateScalesFrameCount) {
  const std::string video = TestVideoPath();
  if (video.empty()) {
    GTEST_SKIP() << "CLIPSHARD_TEST_VIDEO not set";
  }

  FFmpegDecodeEngine engine;
  DecodeResult slow = engine.DecodeRaw(MakeRequest(video, 4));
  DecodeResult fast = engine.DecodeRaw(MakeRequest(video, 8));
  ASSERT_TRUE(slow.ok && fast.ok);
  const int64_t slow_frames = slow.frames.FrameCount(kSmall.FrameBytes());
  const int64_t fast_frames = fast.frames.FrameCount(kSmall.FrameBytes());
  // Same duration at twice the rate: within one frame of double.
  EXPECT_NEAR(static_cast<double>(fast_frames), 2.0 * slow_frames, 2.0);
}

TEST(FFmpegDecodeEngineTest, ImageDecodeWritesSortedJpegs) {
  const std::string video = TestVideoPath();
  if (video.empty()) {
    GTEST_SKIP() << "CLIPSHARD_TEST_VIDEO not set";
  }

  TempDir tmp("decode");
  FFmpegDecodeEngine engine;
  DecodeResult result = engine.DecodeToImages(MakeRequest(video), tmp.path());
  ASSERT_TRUE(result.ok) << result.error;
  ASSERT_FALSE(result.frames.frame_files.empty());
  EXPECT_EQ(fs::path(result.frames.frame_files.front()).filename().string(),
            "frame_000001.jpg");
  EXPECT_TRUE(std::is_sorted(result.frames.frame_files.begin(),
                             result.frames.frame_files.end()));
  for (const auto& file : result.frames.frame_files) {
    const auto bytes = tests::fixtures::ReadFileBytes(file);
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0xFF);  // SOI marker
    EXPECT_EQ(bytes[1], 0xD8);
  }

  // Black padding frame, not counted among the decoded frames.
  ASSERT_FALSE(result.frames.zero_frame_file.empty());
  EXPECT_TRUE(std::find(result.frames.frame_files.begin(),
                        result.frames.frame_files.end(),
                        result.frames.zero_frame_file) == result.frames.frame_files.end());
  const auto zero = tests::fixtures::ReadFileBytes(result.frames.zero_frame_file);
  ASSERT_GE(zero.size(), 2u);
  EXPECT_EQ(zero[0], 0xFF);
  EXPECT_EQ(zero[1], 0xD8);
}

}  // namespace
}  // namespace clipshard::decode
