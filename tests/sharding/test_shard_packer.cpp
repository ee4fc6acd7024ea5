// Repository: RetroVue-clipshard
// Component: ShardPacker unit tests

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "clipshard/archive/TarReader.hpp"
#include "clipshard/format/ChunkMetadata.hpp"
#include "clipshard/sharding/ShardPacker.hpp"
#include "fixtures/TempDir.h"

namespace fs = std::filesystem;

namespace clipshard::sharding {
namespace {

using chunking::ChunkError;
using chunking::ChunkName;
using chunking::OutputFormat;
using tests::fixtures::TempDir;
using tests::fixtures::WriteFileText;

std::vector<std::string> EntryNames(const std::string& tar_path) {
  std::vector<std::string> names;
  archive::TarReader reader;
  EXPECT_TRUE(reader.Open(tar_path)) << reader.LastError();
  archive::TarEntry entry;
  while (reader.Next(entry) == archive::TarReader::NextStatus::kEntry) {
    names.push_back(entry.name);
  }
  return names;
}

std::string ValidMetadata(const std::string& key) {
  format::ChunkMetadata metadata;
  metadata.key = key;
  metadata.fps = 8;
  metadata.frame_count = 2;
  metadata.height = 4;
  metadata.width = 4;
  return metadata.ToJson();
}

// Lays out <root>/clipNNN/chunk_NNNNN.npy (+ sidecar) for `clips` x `chunks`.
void MakeNpyTree(const std::string& root, int clips, int chunks) {
  for (int c = 0; c < clips; ++c) {
    const std::string dir = root + "/clip" + std::to_string(c);
    fs::create_directories(dir);
    for (int k = 0; k < chunks; ++k) {
      WriteFileText(dir + "/" + ChunkName(k) + ".npy", "npy");
      WriteFileText(dir + "/" + ChunkName(k) + "_metadata.json", "{}");
    }
  }
}

TEST(ShardPackerTest, ShardNamesAreFiveDigit) {
  EXPECT_EQ(ShardName(0), "shard_00000.tar");
  EXPECT_EQ(ShardName(123), "shard_00123.tar");
}

// -----------------------------------------------------------------------------
// 10,000 artifacts at capacity 1000: exactly ten full shards
// -----------------------------------------------------------------------------
TEST(ShardPackerTest, TenThousandArtifactsMakeTenShards) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  MakeNpyTree(input.path(), 100, 100);

  ShardPacker packer(OutputFormat::kNpy, 1000);
  PackResult result = packer.Pack(input.path(), output.path());
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.shards_written, 10);
  EXPECT_EQ(result.samples, 10000);

  for (int i = 0; i < 10; ++i) {
    const std::string shard = output.Join(ShardName(i));
    ASSERT_TRUE(fs::exists(shard)) << shard;
    const auto names = EntryNames(shard);
    EXPECT_EQ(names.size(), 1000u);
    EXPECT_TRUE(std::all_of(names.begin(), names.end(), [](const std::string& n) {
      return n.find('/') == std::string::npos && n.size() == 15;  // chunk_NNNNN.npy
    }));
  }
  EXPECT_FALSE(fs::exists(output.Join(ShardName(10))));
}

TEST(ShardPackerTest, LastShardHoldsRemainder) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  MakeNpyTree(input.path(), 5, 5);

  PackResult result = ShardPacker(OutputFormat::kNpy, 10).Pack(input.path(), output.path());
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.shards_written, 3);
  EXPECT_EQ(EntryNames(output.Join("shard_00002.tar")).size(), 5u);
}

TEST(ShardPackerTest, RepeatedRunsProduceSameShardCount) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  MakeNpyTree(input.path(), 7, 13);

  ShardPacker packer(OutputFormat::kNpy, 20);
  PackResult first = packer.Pack(input.path(), output.path());
  PackResult second = packer.Pack(input.path(), output.path());
  ASSERT_TRUE(first.ok && second.ok);
  EXPECT_EQ(first.shards_written, second.shards_written);
  EXPECT_EQ(first.shards_written, 5);
}

TEST(ShardPackerTest, EmptyTreeWritesNoShards) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  PackResult result = ShardPacker(OutputFormat::kNpy, 10).Pack(input.path(), output.path());
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.shards_written, 0);
  EXPECT_TRUE(fs::is_empty(output.path()));
}

TEST(ShardPackerTest, ImageChunksKeepDirectoryPrefix) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  const std::string chunk = input.Join("clipA/chunk_00000");
  fs::create_directories(chunk);
  WriteFileText(chunk + "/frame_002.jpg", "b");
  WriteFileText(chunk + "/frame_001.jpg", "a");
  WriteFileText(chunk + "/metadata.json", ValidMetadata("clipA/chunk_00000"));

  // Not samples: no metadata, unparseable metadata, wrong directory name.
  fs::create_directories(input.Join("clipA/chunk_00001"));
  WriteFileText(input.Join("clipA/chunk_00001/frame_001.jpg"), "x");
  fs::create_directories(input.Join("clipB/chunk_00000"));
  WriteFileText(input.Join("clipB/chunk_00000/metadata.json"), "not json");
  fs::create_directories(input.Join("clipB/extras"));
  WriteFileText(input.Join("clipB/extras/metadata.json"), ValidMetadata("x"));

  PackResult result = ShardPacker(OutputFormat::kJpeg, 100).Pack(input.path(), output.path());
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.samples, 1);
  EXPECT_EQ(result.shards_written, 1);

  const auto names = EntryNames(output.Join("shard_00000.tar"));
  EXPECT_EQ(names, (std::vector<std::string>{"chunk_00000/frame_001.jpg",
                                             "chunk_00000/frame_002.jpg",
                                             "chunk_00000/metadata.json"}));
}

TEST(ShardPackerTest, UnwritableOutputReportsShardIndex) {
  TempDir input("shard_in");
  MakeNpyTree(input.path(), 1, 3);

  PackResult result =
      ShardPacker(OutputFormat::kNpy, 2).Pack(input.path(), "/nonexistent-clipshard-shards");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ChunkError::kArchive);
  EXPECT_EQ(result.shards_written, 0);
  EXPECT_EQ(result.detail.rfind("error creating shard 0: ", 0), 0u) << result.detail;
}

TEST(ShardPackerTest, MissingInputRootFails) {
  TempDir output("shard_out");
  PackResult result =
      ShardPacker(OutputFormat::kNpy, 2).Pack("/nonexistent-clipshard-input", output.path());
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ChunkError::kFilesystem);
}

TEST(PackShardsTest, ValidatesAndCreatesShardDirectory) {
  TempDir input("shard_in");
  TempDir output("shard_out");
  MakeNpyTree(input.path(), 2, 2);

  EXPECT_EQ(PackShards(input.path(), output.Join("s"), 0, "npy").error,
            ChunkError::kInvalidShardSize);
  EXPECT_EQ(PackShards(input.path(), output.Join("s"), 10, "png").error,
            ChunkError::kInvalidFormat);
  EXPECT_FALSE(fs::exists(output.Join("s")));

  PackResult result = PackShards(input.path(), output.Join("s/nested"), 3, "npy");
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.shards_written, 2);
  EXPECT_TRUE(fs::exists(output.Join("s/nested/shard_00001.tar")));
}

}  // namespace
}  // namespace clipshard::sharding
