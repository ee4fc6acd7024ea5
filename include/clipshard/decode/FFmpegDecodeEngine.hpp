// Repository: RetroVue-clipshard
// Component: FFmpeg Decode Engine
// Purpose: IDecodeEngine backed by FFmpegDecoder with PTS-driven fps
//          resampling and MJPEG frame export.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_DECODE_FFMPEG_DECODE_ENGINE_HPP_
#define CLIPSHARD_DECODE_FFMPEG_DECODE_ENGINE_HPP_

#include <functional>
#include <string>

#include "clipshard/decode/FFmpegDecoder.hpp"
#include "clipshard/decode/IDecodeEngine.hpp"

namespace clipshard::decode {

// Output tick n sits at n / fps seconds. Each tick takes the latest decoded
// frame whose PTS is at or before it, so frames repeat when the source is
// slower than the target and are dropped when it is faster. The last frame
// covers ticks up to its own end time (PTS + one source frame).
//
// Image export names frames frame_000001.jpg, frame_000002.jpg, ... so that
// lexicographic order is temporal order for any clip length.
class FFmpegDecodeEngine : public IDecodeEngine {
 public:
  // jpeg_qscale: MJPEG quantizer, 2 (best) .. 31 (worst).
  explicit FFmpegDecodeEngine(int jpeg_qscale = 2);
  ~FFmpegDecodeEngine() override = default;

  DecodeResult DecodeRaw(const DecodeRequest& request) override;
  DecodeResult DecodeToImages(const DecodeRequest& request,
                              const std::string& output_dir) override;

 private:
  // Returns false to abort decoding (sink failure).
  using FrameSink = std::function<bool(const DecodedFrame&, std::string& error)>;

  // Decodes request.input_path and feeds resampled frames to sink.
  // On failure sets error; source_fps is the rounded nominal input rate.
  bool RunResampled(const DecodeRequest& request, const FrameSink& sink,
                    int& source_fps, std::string& error);

  int jpeg_qscale_;
};

}  // namespace clipshard::decode

#endif  // CLIPSHARD_DECODE_FFMPEG_DECODE_ENGINE_HPP_
