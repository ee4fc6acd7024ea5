// Repository: RetroVue-clipshard
// Component: Clip Chunk Serializer
// Purpose: Write a clip's planned chunks as .npy tensors or JPEG directories.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_CHUNKING_CLIP_CHUNK_SERIALIZER_HPP_
#define CLIPSHARD_CHUNKING_CLIP_CHUNK_SERIALIZER_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"
#include "clipshard/chunking/FrameStream.hpp"
#include "clipshard/format/ChunkMetadata.hpp"

namespace clipshard::chunking {

// Everything about the clip a serializer needs besides its frames.
struct ChunkContext {
  std::string clip_key;
  std::string clip_dir;   // <outputDir>/<clipKey>, already created
  int fps = 0;
  Dimensions dims;
  int original_fps = 0;   // 0 when the source rate is unknown
};

// One persisted chunk. path is the .npy file (kNpy) or the chunk directory
// (kJpeg).
struct ChunkArtifact {
  int64_t chunk_index = 0;
  std::string path;
  std::string metadata_path;
  format::ChunkMetadata metadata;
};

struct SerializeResult {
  bool ok;
  ChunkError error;
  std::string detail;
  std::vector<ChunkArtifact> artifacts;

  static SerializeResult Success(std::vector<ChunkArtifact> a) {
    return {true, ChunkError::kNone, "", std::move(a)};
  }

  static SerializeResult Failure(ChunkError err, const std::string& detail = "") {
    return {false, err, detail, {}};
  }
};

// IChunkSerializer is the single point where the two output formats diverge.
// Serialize() consumes the frame stream: raw buffers are released and frame
// files are moved into chunk directories or deleted.
//
// Failures (directory creation, rename, write, shape mismatch) abort the clip
// and carry the underlying error in detail. Chunks written before the failure
// are left in place.
class IChunkSerializer {
 public:
  virtual ~IChunkSerializer() = default;

  virtual OutputFormat Format() const = 0;

  virtual SerializeResult Serialize(const ChunkContext& context,
                                    FrameStream& frames,
                                    const ChunkPlan& plan) = 0;
};

// <clip_dir>/chunk_NNNNN.npy shaped (target_frames, height, width, 3) plus
// <clip_dir>/chunk_NNNNN_metadata.json. Padded chunks are zero-filled.
class NpyChunkSerializer : public IChunkSerializer {
 public:
  OutputFormat Format() const override { return OutputFormat::kNpy; }
  SerializeResult Serialize(const ChunkContext& context, FrameStream& frames,
                            const ChunkPlan& plan) override;
};

// <clip_dir>/chunk_NNNNN/frame_001.jpg ... plus chunk_NNNNN/metadata.json.
// Frame files are renamed (not copied) into place. Padded chunks are filled
// with copies of FrameStream::zero_frame_file up to the chunk length. Frames
// outside every range are deleted, as is the zero frame.
class ImageChunkSerializer : public IChunkSerializer {
 public:
  OutputFormat Format() const override { return OutputFormat::kJpeg; }
  SerializeResult Serialize(const ChunkContext& context, FrameStream& frames,
                            const ChunkPlan& plan) override;
};

std::unique_ptr<IChunkSerializer> MakeChunkSerializer(OutputFormat format);

}  // namespace clipshard::chunking

#endif  // CLIPSHARD_CHUNKING_CLIP_CHUNK_SERIALIZER_HPP_
