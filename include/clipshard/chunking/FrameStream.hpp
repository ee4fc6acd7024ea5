// Repository: RetroVue-clipshard
// Component: Frame Stream
// Purpose: Decoded frames of one clip, as a raw buffer or per-frame files.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_CHUNKING_FRAME_STREAM_HPP_
#define CLIPSHARD_CHUNKING_FRAME_STREAM_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace clipshard::chunking {

// Exactly one representation is populated, matching the run's OutputFormat:
//   raw          packed RGB24, frame after frame (kNpy)
//   frame_files  full paths, sorted so name order == temporal order (kJpeg)
struct FrameStream {
  std::vector<uint8_t> raw;
  std::vector<std::string> frame_files;

  // kJpeg only: an all-zero (black) frame encoded the same way as the others,
  // copied into every position of a padded tail. Not counted as a frame.
  std::string zero_frame_file;

  // Number of frames held. For raw this is raw.size() / frame_bytes and the
  // caller checks divisibility separately.
  int64_t FrameCount(int64_t frame_bytes) const {
    if (!frame_files.empty()) return static_cast<int64_t>(frame_files.size());
    return frame_bytes > 0 ? static_cast<int64_t>(raw.size()) / frame_bytes : 0;
  }
};

}  // namespace clipshard::chunking

#endif  // CLIPSHARD_CHUNKING_FRAME_STREAM_HPP_
