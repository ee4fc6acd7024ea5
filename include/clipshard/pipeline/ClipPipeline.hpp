// Repository: RetroVue-clipshard
// Component: Clip Pipeline
// Purpose: Per-clip driver: temp input, decode, plan, serialize, cleanup.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_PIPELINE_CLIP_PIPELINE_HPP_
#define CLIPSHARD_PIPELINE_CLIP_PIPELINE_HPP_

#include <cstdint>
#include <string>

#include "clipshard/chunking/ChunkTypes.hpp"
#include "clipshard/chunking/Clip.hpp"
#include "clipshard/decode/IDecodeEngine.hpp"

namespace clipshard::pipeline {

// Settings shared by every clip of a run.
struct PipelineParams {
  std::string output_dir;
  int fps = 0;
  chunking::Dimensions dims;
  chunking::OutputFormat format = chunking::OutputFormat::kJpeg;
  int64_t target_frames = 0;
  chunking::PadPolicy policy = chunking::PadPolicy::kTruncate;
  std::string temp_dir;  // empty: system temp directory
};

struct ClipResult {
  chunking::ChunkStatus status;
  int64_t frames_decoded = 0;
  int64_t chunks_written = 0;
  int64_t frames_discarded = 0;

  bool ok() const { return status.ok; }
};

// Stateless apart from its references; one instance may serve several
// threads provided the engine does.
//
// Process() runs:
//   materialize temp input -> decode -> plan chunks -> serialize -> cleanup
// A decode failure is reported as the clip's failure (kDecodeFailed). There
// are no retries. The temp input is removed on every exit path. Chunks
// written before a serialization failure are left in place.
class ClipPipeline {
 public:
  ClipPipeline(decode::IDecodeEngine& engine, PipelineParams params);

  ClipResult Process(const chunking::Clip& clip) const;

  const PipelineParams& params() const { return params_; }

 private:
  decode::IDecodeEngine& engine_;
  PipelineParams params_;
};

// Keys become directory names under the output root. Rejects empty keys,
// '/', '\\', "." and "..".
bool IsSafeClipKey(const std::string& key);

}  // namespace clipshard::pipeline

#endif  // CLIPSHARD_PIPELINE_CLIP_PIPELINE_HPP_
