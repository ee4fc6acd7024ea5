// Repository: RetroVue-clipshard
// Component: Parallel Orchestrator
// Purpose: Fan a batch of clips out over a bounded worker pool and collect
//          per-clip failures without aborting the batch.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_PIPELINE_PARALLEL_ORCHESTRATOR_HPP_
#define CLIPSHARD_PIPELINE_PARALLEL_ORCHESTRATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"
#include "clipshard/chunking/Clip.hpp"
#include "clipshard/decode/IDecodeEngine.hpp"
#include "clipshard/pipeline/ClipPipeline.hpp"

namespace clipshard::pipeline {

// Used when the caller has no better figure (hardware_concurrency unknown).
constexpr int kDefaultWorkerCount = 4;

struct OrchestratorConfig {
  int worker_count = kDefaultWorkerCount;  // clamped to at least 1
};

struct ClipFailure {
  size_t clip_index = 0;  // position in the input batch
  std::string key;
  chunking::ChunkStatus status;
};

struct BatchResult {
  // Ordered by clip_index.
  std::vector<ClipFailure> failures;
  int64_t clips_processed = 0;
  int64_t chunks_written = 0;
  int64_t elapsed_ms = 0;

  bool ok() const { return failures.empty(); }

  // "encountered N errors: [error processing k1: d1; error processing k2: d2]"
  // Empty when ok().
  std::string AggregateMessage() const;
};

// Fail-soft batch runner. Every clip is attempted exactly once; failures are
// collected under a mutex and reported together after all workers have
// drained the shared queue. There is no cancellation.
class ParallelOrchestrator {
 public:
  ParallelOrchestrator(decode::IDecodeEngine& engine, OrchestratorConfig config);

  BatchResult Run(const std::vector<chunking::Clip>& clips,
                  const PipelineParams& params);

  int worker_count() const { return worker_count_; }

 private:
  decode::IDecodeEngine& engine_;
  int worker_count_;
};

// Batch entry point. Validates fps, size, format and target_frames before
// any clip is touched (those failures carry their own error codes). A batch
// with failed clips returns kDecodeFailed/kFilesystem/... of the first failed
// clip and the aggregate message as detail.
chunking::ChunkStatus ProcessAll(
    decode::IDecodeEngine& engine,
    const std::vector<chunking::Clip>& clips,
    const std::string& output_dir, int fps, const std::string& size,
    const std::string& format, int64_t target_frames, int worker_count,
    chunking::PadPolicy policy = chunking::PadPolicy::kTruncate,
    const std::string& temp_dir = "");

}  // namespace clipshard::pipeline

#endif  // CLIPSHARD_PIPELINE_PARALLEL_ORCHESTRATOR_HPP_
