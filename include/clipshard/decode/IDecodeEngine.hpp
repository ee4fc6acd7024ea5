// Repository: RetroVue-clipshard
// Component: Decode Engine Interface
// Purpose: Seam between the clip pipeline and the video decoder.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_DECODE_IDECODE_ENGINE_HPP_
#define CLIPSHARD_DECODE_IDECODE_ENGINE_HPP_

#include <string>

#include "clipshard/chunking/ChunkTypes.hpp"
#include "clipshard/chunking/FrameStream.hpp"

namespace clipshard::decode {

struct DecodeRequest {
  std::string input_path;   // encoded video on local disk
  int fps = 0;              // output frame rate
  chunking::Dimensions dims;  // output frame size
};

struct DecodeResult {
  bool ok;
  std::string error;  // opaque engine message when !ok
  chunking::FrameStream frames;
  int source_fps;     // rounded nominal input rate, 0 if unknown

  static DecodeResult Success(chunking::FrameStream f, int source_fps) {
    return {true, "", std::move(f), source_fps};
  }

  static DecodeResult Failure(const std::string& error) {
    return {false, error, {}, 0};
  }
};

// IDecodeEngine converts one encoded clip into frames at the requested rate
// and size. Implementations must allow concurrent calls from several worker
// threads (each call works on its own input and output paths).
class IDecodeEngine {
 public:
  virtual ~IDecodeEngine() = default;

  // Packed RGB24 frames in FrameStream::raw.
  virtual DecodeResult DecodeRaw(const DecodeRequest& request) = 0;

  // One JPEG per frame written into output_dir (which must exist), returned
  // sorted in FrameStream::frame_files, plus one black frame of the same size
  // in FrameStream::zero_frame_file for padding.
  virtual DecodeResult DecodeToImages(const DecodeRequest& request,
                                      const std::string& output_dir) = 0;
};

}  // namespace clipshard::decode

#endif  // CLIPSHARD_DECODE_IDECODE_ENGINE_HPP_
