// Repository: RetroVue-clipshard
// Component: Run configuration unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "clipshard/runtime/RunConfig.hpp"
#include "fixtures/TempDir.h"

namespace clipshard::runtime {
namespace {

using chunking::ChunkError;
using tests::fixtures::TempDir;
using tests::fixtures::WriteFileText;

CliParseResult Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "clipshard");
  std::vector<const char*> argv;
  for (const auto& a : args) argv.push_back(a.c_str());
  return ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}

TEST(RunConfigTest, DefaultsMatchTheDocumentedTool) {
  auto parsed = Parse({});
  ASSERT_TRUE(parsed.ok) << parsed.error;
  const RunConfig& config = parsed.config;
  EXPECT_EQ(config.tar_path, "");
  EXPECT_EQ(config.output_dir, "output");
  EXPECT_EQ(config.fps, 8);
  EXPECT_EQ(config.size, "256x256");
  EXPECT_EQ(config.format, "jpg");
  EXPECT_EQ(config.frames, 16);
  EXPECT_FALSE(config.pad);
  EXPECT_GE(config.workers, 1);
  EXPECT_EQ(config.shard_size, 1000);
  EXPECT_EQ(config.shard_dir, "");
  EXPECT_TRUE(config.Policy() == chunking::PadPolicy::kTruncate);
  EXPECT_TRUE(config.Validate().ok);
}

TEST(RunConfigTest, ParsesEveryFlag) {
  auto parsed = Parse({"--tar", "in.tar", "--out", "frames", "--fps", "12", "--size",
                       "64x48", "--format", "npy", "--frames", "32", "--pad",
                       "--workers", "3", "--shard-size", "50", "--shard-dir", "shards",
                       "--tmp-dir", "/var/tmp"});
  ASSERT_TRUE(parsed.ok) << parsed.error;
  const RunConfig& config = parsed.config;
  EXPECT_EQ(config.tar_path, "in.tar");
  EXPECT_EQ(config.output_dir, "frames");
  EXPECT_EQ(config.fps, 12);
  EXPECT_EQ(config.size, "64x48");
  EXPECT_EQ(config.format, "npy");
  EXPECT_EQ(config.frames, 32);
  EXPECT_TRUE(config.pad);
  EXPECT_TRUE(config.Policy() == chunking::PadPolicy::kPad);
  EXPECT_EQ(config.workers, 3);
  EXPECT_EQ(config.shard_size, 50);
  EXPECT_EQ(config.shard_dir, "shards");
  EXPECT_EQ(config.tmp_dir, "/var/tmp");
}

TEST(RunConfigTest, RejectsUnknownFlagsAndBadNumbers) {
  EXPECT_FALSE(Parse({"--bogus", "1"}).ok);
  EXPECT_FALSE(Parse({"--fps"}).ok);

  auto bad = Parse({"--frames", "sixteen"});
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.error, "invalid value for --frames: sixteen");
}

TEST(RunConfigTest, HelpStopsParsing) {
  auto parsed = Parse({"--help", "--bogus"});
  ASSERT_TRUE(parsed.ok);
  EXPECT_TRUE(parsed.config.help);
}

TEST(RunConfigTest, ConfigFileIsOverriddenByFlags) {
  TempDir tmp("config");
  const std::string path = tmp.Join("run.json");
  WriteFileText(path,
                "{\n"
                "  \"output_dir\": \"from_file\",\n"
                "  \"fps\": 4,\n"
                "  \"size\": \"32x32\",\n"
                "  \"format\": \"npy\",\n"
                "  \"frames\": 8,\n"
                "  \"pad\": true,\n"
                "  \"workers\": 2,\n"
                "  \"shard_size\": 10,\n"
                "  \"shard_dir\": \"shards\",\n"
                "  \"tar\": \"clips.tar\",\n"
                "  \"tmp_dir\": \"/scratch\"\n"
                "}\n");

  auto parsed = Parse({"--fps", "24", "--config", path});
  ASSERT_TRUE(parsed.ok) << parsed.error;
  const RunConfig& config = parsed.config;
  EXPECT_EQ(config.fps, 24);
  EXPECT_EQ(config.output_dir, "from_file");
  EXPECT_EQ(config.size, "32x32");
  EXPECT_EQ(config.format, "npy");
  EXPECT_EQ(config.frames, 8);
  EXPECT_TRUE(config.pad);
  EXPECT_EQ(config.workers, 2);
  EXPECT_EQ(config.shard_size, 10);
  EXPECT_EQ(config.shard_dir, "shards");
  EXPECT_EQ(config.tar_path, "clips.tar");
  EXPECT_EQ(config.tmp_dir, "/scratch");
  EXPECT_EQ(config.config_path, path);
}

TEST(RunConfigTest, ConfigFileErrors) {
  EXPECT_FALSE(Parse({"--config", "/nonexistent/run.json"}).ok);

  RunConfig config;
  std::string error;
  EXPECT_FALSE(ApplyJsonConfig("{\"fps\": \"fast\"}", config, error));
  EXPECT_EQ(error, "config field 'fps' must be an integer");
  EXPECT_FALSE(ApplyJsonConfig("{\"size\": 256}", config, error));
  EXPECT_FALSE(ApplyJsonConfig("{\"pad\": \"yes\"}", config, error));
  EXPECT_TRUE(ApplyJsonConfig("{\"unrelated\": 1}", config, error));
}

TEST(RunConfigTest, ValidateReportsFirstInvalidSetting) {
  RunConfig config;
  config.size = "256";
  EXPECT_EQ(config.Validate().error, ChunkError::kInvalidSize);

  config = RunConfig();
  config.format = "gif";
  auto status = config.Validate();
  EXPECT_EQ(status.error, ChunkError::kInvalidFormat);
  EXPECT_EQ(status.detail, "unsupported format gif. Supported formats are: jpg, npy");

  config = RunConfig();
  config.frames = 0;
  EXPECT_EQ(config.Validate().error, ChunkError::kInvalidChunkLength);

  config = RunConfig();
  config.fps = -1;
  EXPECT_EQ(config.Validate().error, ChunkError::kInvalidFps);

  config = RunConfig();
  config.workers = -2;
  EXPECT_EQ(config.Validate().error, ChunkError::kInvalidWorkerCount);

  config = RunConfig();
  config.shard_size = 0;
  EXPECT_TRUE(config.Validate().ok);  // sharding not requested
  config.shard_dir = "shards";
  EXPECT_EQ(config.Validate().error, ChunkError::kInvalidShardSize);
}

// frame_NNN names only sort in frame order up to 999 frames per chunk.
TEST(RunConfigTest, ImageChunksAreLimitedToThreeDigitFrameNames) {
  RunConfig config;
  config.format = "jpg";
  config.frames = 999;
  EXPECT_TRUE(config.Validate().ok);

  config.frames = 1000;
  auto status = config.Validate();
  EXPECT_EQ(status.error, ChunkError::kInvalidChunkLength);
  EXPECT_EQ(status.detail,
            "invalid chunk length: 1000 (jpg chunks hold at most 999 frames)");

  config.format = "npy";
  EXPECT_TRUE(config.Validate().ok);
}

TEST(RunConfigTest, LogLevelFromFlagOrFile) {
  auto parsed = Parse({"--log-level", "warn"});
  ASSERT_TRUE(parsed.ok) << parsed.error;
  EXPECT_EQ(parsed.config.log_level, "warn");
  EXPECT_TRUE(parsed.config.Validate().ok);

  RunConfig config;
  std::string error;
  ASSERT_TRUE(ApplyJsonConfig("{\"log_level\": \"debug\"}", config, error)) << error;
  EXPECT_EQ(config.log_level, "debug");

  config.log_level = "verbose";
  auto status = config.Validate();
  EXPECT_EQ(status.error, ChunkError::kInvalidLogLevel);
  EXPECT_EQ(status.detail,
            "invalid log level verbose. Supported levels are: debug, info, warn, error");
}

}  // namespace
}  // namespace clipshard::runtime
