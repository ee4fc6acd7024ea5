// Repository: RetroVue-clipshard
// Component: Chunk Planner
// Purpose: Partition a clip's frame stream into fixed-length chunk ranges.
// Copyright (c) 2026 RetroVue

#include "clipshard/chunking/ChunkPlanner.hpp"

#include <sstream>

namespace clipshard::chunking {

ChunkPlanner::PlanResult ChunkPlanner::Plan(int64_t total_frames,
                                            int64_t target_frames,
                                            PadPolicy policy) {
  if (target_frames <= 0) {
    std::ostringstream detail;
    detail << "target_frames must be positive (got " << target_frames << ")";
    return PlanResult::Failure(ChunkError::kInvalidChunkLength, detail.str());
  }
  if (total_frames < 0) {
    std::ostringstream detail;
    detail << "total_frames is negative (" << total_frames << ")";
    return PlanResult::Failure(ChunkError::kShapeMismatch, detail.str());
  }

  const int64_t complete = total_frames / target_frames;
  const int64_t remainder = total_frames % target_frames;
  const bool pad_tail = (policy == PadPolicy::kPad) && remainder > 0;
  const int64_t chunk_count = complete + (pad_tail ? 1 : 0);

  if (chunk_count > kMaxChunksPerClip) {
    std::ostringstream detail;
    detail << "plan needs " << chunk_count << " chunks, limit is "
           << kMaxChunksPerClip;
    return PlanResult::Failure(ChunkError::kChunkIndexOverflow, detail.str());
  }

  ChunkPlan plan;
  plan.total_frames = total_frames;
  plan.target_frames = target_frames;
  plan.policy = policy;
  plan.ranges.reserve(static_cast<size_t>(chunk_count));

  for (int64_t i = 0; i < complete; ++i) {
    ChunkRange range;
    range.start_frame = i * target_frames;
    range.end_frame = range.start_frame + target_frames;
    plan.ranges.push_back(range);
  }

  if (pad_tail) {
    ChunkRange tail;
    tail.start_frame = complete * target_frames;
    tail.end_frame = total_frames;
    tail.is_complete = false;
    tail.is_padded = true;
    plan.ranges.push_back(tail);
  } else if (remainder > 0) {
    plan.discarded_frames = remainder;
    if (!plan.ranges.empty()) {
      plan.ranges.back().is_trimmed = true;
    }
  }

  return PlanResult::Success(std::move(plan));
}

}  // namespace clipshard::chunking
