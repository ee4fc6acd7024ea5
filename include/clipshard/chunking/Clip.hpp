// Repository: RetroVue-clipshard
// Component: Clip
// Purpose: One encoded video extracted from the input archive.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_CHUNKING_CLIP_HPP_
#define CLIPSHARD_CHUNKING_CLIP_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace clipshard::chunking {

// key is unique within a batch and names the clip's output directory.
struct Clip {
  std::string key;
  std::vector<uint8_t> data;
};

}  // namespace clipshard::chunking

#endif  // CLIPSHARD_CHUNKING_CLIP_HPP_
