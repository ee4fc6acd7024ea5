// Repository: RetroVue-clipshard
// Component: FFmpeg Decoder
// Purpose: Video decoding to packed RGB24 using libavformat/libavcodec.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_DECODE_FFMPEG_DECODER_HPP_
#define CLIPSHARD_DECODE_FFMPEG_DECODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace clipshard::decode {

// DecoderConfig holds configuration for FFmpeg-based decoding.
struct DecoderConfig {
  std::string input_uri;        // File path or URI to decode
  int target_width;             // Output width (scaled)
  int target_height;            // Output height (scaled)
  int max_decode_threads;       // Maximum decoder threads (0 = auto)

  DecoderConfig()
      : target_width(256),
        target_height(256),
        max_decode_threads(1) {}
};

// One decoded, scaled frame. data is packed RGB24, width * 3 bytes per row.
struct DecodedFrame {
  int64_t pts_us = 0;  // presentation time relative to stream start
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;
};

// FFmpegDecoder decodes the first video stream of a file.
//
// Thread Safety:
// - Not thread-safe: one instance per worker. Separate instances may run
//   concurrently.
//
// Lifecycle:
// 1. Construct with config
// 2. Call Open() to initialize decoder
// 3. Call DecodeNextFrame() until it returns false
// 4. IsEOF() distinguishes end of stream from a hard error (LastError())
// 5. Call Close() or rely on destructor
//
// Error Handling:
// - Returns false on errors; LastError() carries the failing step
// - Packets the codec rejects are skipped and counted in DecodeErrors()
class FFmpegDecoder {
 public:
  explicit FFmpegDecoder(const DecoderConfig& config);
  ~FFmpegDecoder();

  // Disable copy and move
  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  // Opens the input file and initializes decoder.
  // Returns true on success, false on error.
  bool Open();

  // Decodes the next frame in presentation order. Drains the codec at end of
  // input so trailing frames held by the decoder are not lost.
  bool DecodeNextFrame(DecodedFrame& output_frame);

  // Closes the decoder and releases resources.
  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }
  const std::string& LastError() const { return last_error_; }
  uint64_t DecodeErrors() const { return decode_errors_; }

  // Nominal stream rate (r_frame_rate) as num/den; {0, 1} when unknown.
  void GetVideoFrameRate(int64_t& num, int64_t& den) const;

  // Duration of one source frame in microseconds; 0 when the rate is unknown.
  int64_t SourceFrameDurationUs() const;

 private:
  bool FindVideoStream();
  bool InitializeCodec();

  // Recreates the scaler when the decoded frame geometry/format changes.
  bool EnsureScaler(const AVFrame* av_frame);

  // Pulls one frame from the codec: 1 = frame, 0 = needs input / drained,
  // -1 = hard error.
  int ReceiveFrame(DecodedFrame& output_frame);

  bool ConvertFrame(AVFrame* av_frame, DecodedFrame& output_frame);

  void SetError(const std::string& step, int ret);

  DecoderConfig config_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int video_stream_index_ = -1;
  bool demux_eof_ = false;
  bool eof_reached_ = false;
  uint64_t decode_errors_ = 0;
  std::string last_error_;

  // Timing
  int64_t start_time_ = 0;
  int64_t last_pts_us_ = -1;
};

}  // namespace clipshard::decode

#endif  // CLIPSHARD_DECODE_FFMPEG_DECODER_HPP_
