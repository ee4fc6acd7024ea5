// Repository: RetroVue-clipshard
// Component: Chunk Planner
// Purpose: Partition a clip's frame stream into fixed-length chunk ranges.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_CHUNKING_CHUNK_PLANNER_HPP_
#define CLIPSHARD_CHUNKING_CHUNK_PLANNER_HPP_

#include <cstdint>
#include <string>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::chunking {

// ChunkPlanner computes the ordered chunk boundaries for one clip.
//
// Every complete range is exactly target_frames long and ranges are emitted
// in increasing start order, which fixes the chunk index of each range.
//
//   kTruncate: floor(total / target) complete ranges; the remainder is
//              discarded and the last complete range is marked is_trimmed.
//   kPad:      the same complete ranges, then one short range covering the
//              remainder, marked is_padded (serializer extends it).
//
// total_frames < target_frames under kTruncate yields an empty plan. That is
// a valid "0 chunks" outcome, not a failure.
class ChunkPlanner {
 public:
  struct PlanResult {
    bool valid;
    ChunkError error;
    std::string detail;
    ChunkPlan plan;

    static PlanResult Success(ChunkPlan p) {
      return {true, ChunkError::kNone, "", std::move(p)};
    }

    static PlanResult Failure(ChunkError err, const std::string& detail = "") {
      return {false, err, detail, {}};
    }
  };

  // Fails with kInvalidChunkLength when target_frames <= 0, kShapeMismatch
  // when total_frames < 0, and kChunkIndexOverflow when the plan would need
  // more than kMaxChunksPerClip chunks.
  static PlanResult Plan(int64_t total_frames, int64_t target_frames,
                         PadPolicy policy);
};

}  // namespace clipshard::chunking

#endif  // CLIPSHARD_CHUNKING_CHUNK_PLANNER_HPP_
