// Repository: RetroVue-clipshard
// Component: Parallel Orchestrator
// Purpose: Fan a batch of clips out over a bounded worker pool and collect
//          per-clip failures without aborting the batch.
// Copyright (c) 2026 RetroVue

#include "clipshard/pipeline/ParallelOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>

#include "clipshard/util/Logger.hpp"

namespace clipshard::pipeline {

using chunking::ChunkError;
using chunking::ChunkStatus;
using util::Logger;

std::string BatchResult::AggregateMessage() const {
  if (failures.empty()) return "";
  std::ostringstream oss;
  oss << "encountered " << failures.size() << " errors: [";
  for (size_t i = 0; i < failures.size(); ++i) {
    if (i > 0) oss << "; ";
    oss << "error processing " << failures[i].key << ": "
        << failures[i].status.detail;
  }
  oss << "]";
  return oss.str();
}

ParallelOrchestrator::ParallelOrchestrator(decode::IDecodeEngine& engine,
                                           OrchestratorConfig config)
    : engine_(engine), worker_count_(std::max(1, config.worker_count)) {}

BatchResult ParallelOrchestrator::Run(const std::vector<chunking::Clip>& clips,
                                      const PipelineParams& params) {
  const auto start = std::chrono::steady_clock::now();
  const ClipPipeline pipeline(engine_, params);

  // Pre-loaded queue: workers claim the next index until it runs past the end.
  std::atomic<size_t> next_clip{0};
  std::atomic<int64_t> chunks_written{0};

  std::mutex failures_mutex;
  std::vector<ClipFailure> failures;

  auto worker = [&]() {
    for (;;) {
      const size_t index = next_clip.fetch_add(1, std::memory_order_relaxed);
      if (index >= clips.size()) return;

      const auto& clip = clips[index];
      ClipResult result;
      try {
        result = pipeline.Process(clip);
      } catch (const std::exception& e) {
        // One clip exhausting memory (or throwing otherwise) fails only itself.
        result.status = ChunkStatus::Failure(
            ChunkError::kDecodeFailed,
            std::string("exception while processing clip: ") + e.what());
      }
      if (result.ok()) {
        chunks_written.fetch_add(result.chunks_written, std::memory_order_relaxed);
        continue;
      }

      Logger::Error("[ParallelOrchestrator] CLIP_FAILED key=" + clip.key +
                    " error=" + result.status.Describe());
      std::lock_guard<std::mutex> lock(failures_mutex);
      failures.push_back(ClipFailure{index, clip.key, result.status});
    }
  };

  const size_t thread_count =
      std::min(static_cast<size_t>(worker_count_), std::max<size_t>(clips.size(), 1));
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  std::sort(failures.begin(), failures.end(),
            [](const ClipFailure& a, const ClipFailure& b) {
              return a.clip_index < b.clip_index;
            });

  BatchResult result;
  result.failures = std::move(failures);
  result.clips_processed = static_cast<int64_t>(clips.size());
  result.chunks_written = chunks_written.load();
  result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();

  std::ostringstream oss;
  oss << "[ParallelOrchestrator] BATCH_DONE clips=" << result.clips_processed
      << " failed=" << result.failures.size()
      << " chunks=" << result.chunks_written
      << " workers=" << thread_count
      << " elapsed_ms=" << result.elapsed_ms;
  Logger::Info(oss.str());
  return result;
}

ChunkStatus ProcessAll(decode::IDecodeEngine& engine,
                       const std::vector<chunking::Clip>& clips,
                       const std::string& output_dir, int fps,
                       const std::string& size, const std::string& format,
                       int64_t target_frames, int worker_count,
                       chunking::PadPolicy policy, const std::string& temp_dir) {
  if (fps <= 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidFps,
                                "invalid fps: " + std::to_string(fps));
  }
  auto dims = chunking::ParseDimensions(size);
  if (!dims.valid) {
    return ChunkStatus::Failure(dims.error, dims.detail);
  }
  auto output_format = chunking::ParseOutputFormat(format);
  if (!output_format) {
    return ChunkStatus::Failure(ChunkError::kInvalidFormat,
                                "unsupported output format: " + format);
  }
  if (target_frames <= 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidChunkLength,
                                "invalid chunk length: " +
                                    std::to_string(target_frames));
  }
  if (*output_format == chunking::OutputFormat::kJpeg &&
      target_frames > chunking::kMaxImageChunkFrames) {
    return ChunkStatus::Failure(ChunkError::kInvalidChunkLength,
                                "invalid chunk length: " +
                                    std::to_string(target_frames) +
                                    " (jpg chunks hold at most " +
                                    std::to_string(chunking::kMaxImageChunkFrames) +
                                    " frames)");
  }

  PipelineParams params;
  params.output_dir = output_dir;
  params.fps = fps;
  params.dims = dims.dims;
  params.format = *output_format;
  params.target_frames = target_frames;
  params.policy = policy;
  params.temp_dir = temp_dir;

  ParallelOrchestrator orchestrator(engine, OrchestratorConfig{worker_count});
  BatchResult batch = orchestrator.Run(clips, params);
  if (batch.ok()) {
    return ChunkStatus::Success();
  }
  return ChunkStatus::Failure(batch.failures.front().status.error,
                              batch.AggregateMessage());
}

}  // namespace clipshard::pipeline
