// Repository: RetroVue-clipshard
// Component: Chunking Types
// Purpose: Data structures shared by chunk planning, serialization and sharding.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_CHUNKING_CHUNK_TYPES_HPP_
#define CLIPSHARD_CHUNKING_CHUNK_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipshard::chunking {

// Frames are always packed RGB24.
constexpr int kRgbChannels = 3;

// chunk_NNNNN: five digits, so at most 100000 chunks per clip.
constexpr int kChunkIndexDigits = 5;
constexpr int64_t kMaxChunksPerClip = 100000;

// frame_NNN inside an image-format chunk directory, numbered from 1. Name
// order must equal frame order, so image chunks hold at most 999 frames.
constexpr int kChunkFrameDigits = 3;
constexpr int64_t kMaxImageChunkFrames = 999;

// =============================================================================
// Error Codes
// =============================================================================

enum class ChunkError {
  // No error
  kNone = 0,

  // Input validation (reported before any clip is processed)
  kInvalidSize,
  kInvalidChunkLength,
  kInvalidFormat,
  kInvalidFps,
  kInvalidWorkerCount,
  kInvalidShardSize,
  kInvalidLogLevel,

  // Per-clip failures
  kDecodeFailed,
  kShapeMismatch,
  kChunkIndexOverflow,
  kFilesystem,

  // Input archive / shard archive failures
  kArchive,
};

// Convert error code to string for logging
const char* ChunkErrorToString(ChunkError error);

// =============================================================================
// Output format and chunk policy
// =============================================================================

// The two serializations diverge completely after planning; the format is
// chosen once per run.
enum class OutputFormat {
  kJpeg,  // directory of frame_NNN.jpg + metadata.json per chunk
  kNpy,   // chunk_NNNNN.npy + chunk_NNNNN_metadata.json per chunk
};

// "jpg" / "npy" (the command-line spelling).
const char* OutputFormatName(OutputFormat format);
std::optional<OutputFormat> ParseOutputFormat(const std::string& name);

enum class PadPolicy {
  kTruncate,  // drop the trailing remainder shorter than the chunk length
  kPad,       // emit the remainder as one final chunk extended to full length
};

const char* PadPolicyName(PadPolicy policy);

// =============================================================================
// Dimensions
// =============================================================================

struct Dimensions {
  int width = 0;
  int height = 0;

  // Bytes of one packed RGB24 frame.
  int64_t FrameBytes() const {
    return static_cast<int64_t>(width) * height * kRgbChannels;
  }

  std::string ToString() const;

  bool operator==(const Dimensions& other) const {
    return width == other.width && height == other.height;
  }
};

struct DimensionsResult {
  bool valid;
  ChunkError error;
  std::string detail;
  Dimensions dims;

  static DimensionsResult Success(Dimensions d) {
    return {true, ChunkError::kNone, "", d};
  }

  static DimensionsResult Failure(const std::string& detail) {
    return {false, ChunkError::kInvalidSize, detail, {}};
  }
};

// Parses "WxH" (e.g. "256x256"). Both components must be positive decimal
// integers and exactly one 'x' separator must be present.
DimensionsResult ParseDimensions(const std::string& size);

// =============================================================================
// Chunk plan
// =============================================================================

// Half-open frame range [start_frame, end_frame) of one chunk.
struct ChunkRange {
  int64_t start_frame = 0;
  int64_t end_frame = 0;

  // False only for the final short range emitted under PadPolicy::kPad.
  bool is_complete = true;

  // Set on the short tail range; the serializer extends it to full length.
  bool is_padded = false;

  // Set on the last complete range when frames after it were discarded.
  bool is_trimmed = false;

  int64_t FrameCount() const { return end_frame - start_frame; }
};

struct ChunkPlan {
  int64_t total_frames = 0;
  int64_t target_frames = 0;
  PadPolicy policy = PadPolicy::kTruncate;

  // Ordered by start_frame; chunk index == position.
  std::vector<ChunkRange> ranges;

  // Frames never referenced by any range (truncate remainder).
  int64_t discarded_frames = 0;

  size_t ChunkCount() const { return ranges.size(); }
};

// "chunk_00042". index must be in [0, kMaxChunksPerClip).
std::string ChunkName(int64_t index);

// "frame_007" (no extension). position is 1-based.
std::string ChunkFrameName(int64_t position);

// =============================================================================
// Status
// =============================================================================

struct ChunkStatus {
  bool ok;
  ChunkError error;
  std::string detail;

  static ChunkStatus Success() { return {true, ChunkError::kNone, ""}; }

  static ChunkStatus Failure(ChunkError err, const std::string& detail = "") {
    return {false, err, detail};
  }

  // "<ERROR_NAME>: <detail>"
  std::string Describe() const;
};

}  // namespace clipshard::chunking

#endif  // CLIPSHARD_CHUNKING_CHUNK_TYPES_HPP_
