// Repository: RetroVue-clipshard
// Component: Chunk metadata unit tests

#include <gtest/gtest.h>

#include "clipshard/format/ChunkMetadata.hpp"
#include "fixtures/TempDir.h"

namespace clipshard::format {
namespace {

using tests::fixtures::ReadFileText;
using tests::fixtures::TempDir;

ChunkMetadata MakeMetadata() {
  ChunkMetadata metadata;
  metadata.key = ChunkMetadataKey("clip_a", 3);
  metadata.fps = 8;
  metadata.frame_count = 16;
  metadata.height = 224;
  metadata.width = 320;
  return metadata;
}

TEST(ChunkMetadataTest, KeyJoinsClipAndChunkName) {
  EXPECT_EQ(ChunkMetadataKey("clip_a", 3), "clip_a/chunk_00003");
}

TEST(ChunkMetadataTest, RendersStableIndentedDocument) {
  EXPECT_EQ(MakeMetadata().ToJson(),
            "{\n"
            "  \"key\": \"clip_a/chunk_00003\",\n"
            "  \"fps\": 8,\n"
            "  \"frame_count\": 16,\n"
            "  \"size\": [\n"
            "    224,\n"
            "    320\n"
            "  ]\n"
            "}");
}

TEST(ChunkMetadataTest, OptionalFieldsAppearOnlyWhenSet) {
  ChunkMetadata metadata = MakeMetadata();
  metadata.is_padded = true;
  metadata.original_fps = 30;
  EXPECT_EQ(metadata.ToJson(),
            "{\n"
            "  \"key\": \"clip_a/chunk_00003\",\n"
            "  \"fps\": 8,\n"
            "  \"frame_count\": 16,\n"
            "  \"size\": [\n"
            "    224,\n"
            "    320\n"
            "  ],\n"
            "  \"is_padded\": true,\n"
            "  \"original_fps\": 30\n"
            "}");
}

TEST(ChunkMetadataTest, EscapesKeyCharacters) {
  ChunkMetadata metadata = MakeMetadata();
  metadata.key = "a\"b<c>&d/chunk_00000";
  const std::string json = metadata.ToJson();
  EXPECT_NE(json.find("\"key\": \"a\\\"b\\u003cc\\u003e\\u0026d/chunk_00000\""),
            std::string::npos);

  auto parsed = ChunkMetadata::FromJson(json);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->key, metadata.key);
}

TEST(ChunkMetadataTest, FromJsonRecoversEveryField) {
  ChunkMetadata metadata = MakeMetadata();
  metadata.is_trimmed = true;
  metadata.original_fps = 25;

  auto parsed = ChunkMetadata::FromJson(metadata.ToJson());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->key, metadata.key);
  EXPECT_EQ(parsed->fps, 8);
  EXPECT_EQ(parsed->frame_count, 16);
  EXPECT_EQ(parsed->height, 224);
  EXPECT_EQ(parsed->width, 320);
  EXPECT_FALSE(parsed->is_padded);
  EXPECT_TRUE(parsed->is_trimmed);
  EXPECT_EQ(parsed->original_fps, 25);
}

TEST(ChunkMetadataTest, FromJsonRejectsMissingRequiredFields) {
  EXPECT_FALSE(ChunkMetadata::FromJson("").has_value());
  EXPECT_FALSE(ChunkMetadata::FromJson("{\"key\": \"x\", \"fps\": 8}").has_value());
  EXPECT_FALSE(ChunkMetadata::FromJson(
                   "{\"fps\": 8, \"frame_count\": 16, \"size\": [1, 2]}")
                   .has_value());
}

TEST(ChunkMetadataTest, WriteProducesFileWithoutTrailingNewline) {
  TempDir tmp("metadata");
  const std::string path = tmp.Join("metadata.json");
  auto status = WriteChunkMetadata(path, MakeMetadata());
  ASSERT_TRUE(status.ok) << status.detail;
  const std::string text = ReadFileText(path);
  EXPECT_EQ(text, MakeMetadata().ToJson());
  EXPECT_EQ(text.back(), '}');
}

}  // namespace
}  // namespace clipshard::format
