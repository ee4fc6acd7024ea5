// Repository: RetroVue-clipshard
// Component: Chunk Metadata
// Purpose: JSON sidecar describing one written chunk.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_FORMAT_CHUNK_METADATA_HPP_
#define CLIPSHARD_FORMAT_CHUNK_METADATA_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::format {

// ChunkMetadata is the durable contract read by dataset loaders. Field names,
// order and shapes must not change:
//
//   {
//     "key": "<clipKey>/chunk_NNNNN",
//     "fps": 8,
//     "frame_count": 16,
//     "size": [
//       <height>,
//       <width>
//     ],
//     "is_padded": true,      (only when true)
//     "is_trimmed": true,     (only when true)
//     "original_fps": 30      (only when known, i.e. non-zero)
//   }
struct ChunkMetadata {
  std::string key;
  int fps = 0;
  int64_t frame_count = 0;
  int height = 0;
  int width = 0;
  bool is_padded = false;
  bool is_trimmed = false;
  int original_fps = 0;

  // Two-space indented document, no trailing newline.
  std::string ToJson() const;

  // Parses a document produced by ToJson(). Returns empty optional when a
  // required field (key, fps, frame_count, size) is missing or malformed.
  static std::optional<ChunkMetadata> FromJson(const std::string& json_str);
};

// "<clip_key>/chunk_NNNNN"
std::string ChunkMetadataKey(const std::string& clip_key, int64_t chunk_index);

// Writes metadata.ToJson() to path, replacing any existing file.
chunking::ChunkStatus WriteChunkMetadata(const std::string& path,
                                         const ChunkMetadata& metadata);

}  // namespace clipshard::format

#endif  // CLIPSHARD_FORMAT_CHUNK_METADATA_HPP_
