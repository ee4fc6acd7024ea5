// Repository: RetroVue-clipshard
// Component: FFmpeg Decode Engine
// Purpose: IDecodeEngine backed by FFmpegDecoder with PTS-driven fps
//          resampling and MJPEG frame export.
// Copyright (c) 2026 RetroVue

#include "clipshard/decode/FFmpegDecodeEngine.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>

#include "clipshard/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libswscale/swscale.h>
}

namespace clipshard::decode {

using util::Logger;

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// Encodes RGB24 frames as standalone JPEG files with the MJPEG encoder.
// One instance per clip; not thread-safe.
class JpegFrameWriter {
 public:
  JpegFrameWriter(int width, int height, int fps, int qscale)
      : width_(width), height_(height), fps_(fps), qscale_(qscale) {}

  ~JpegFrameWriter() {
    if (sws_ctx_) sws_freeContext(sws_ctx_);
    if (yuv_frame_) av_frame_free(&yuv_frame_);
    if (packet_) av_packet_free(&packet_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  }

  JpegFrameWriter(const JpegFrameWriter&) = delete;
  JpegFrameWriter& operator=(const JpegFrameWriter&) = delete;

  bool Open(std::string& error) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
      error = "mjpeg encoder not available";
      return false;
    }
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
      error = "failed to allocate mjpeg encoder context";
      return false;
    }
    codec_ctx_->width = width_;
    codec_ctx_->height = height_;
    codec_ctx_->pix_fmt = AV_PIX_FMT_YUVJ420P;
    codec_ctx_->color_range = AVCOL_RANGE_JPEG;
    codec_ctx_->time_base.num = 1;
    codec_ctx_->time_base.den = fps_;
    codec_ctx_->flags |= AV_CODEC_FLAG_QSCALE;
    codec_ctx_->global_quality = FF_QP2LAMBDA * qscale_;

    int ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
      error = "failed to open mjpeg encoder: " + AvErrorString(ret);
      return false;
    }

    yuv_frame_ = av_frame_alloc();
    packet_ = av_packet_alloc();
    if (!yuv_frame_ || !packet_) {
      error = "failed to allocate encoder frame/packet";
      return false;
    }
    yuv_frame_->format = AV_PIX_FMT_YUVJ420P;
    yuv_frame_->width = width_;
    yuv_frame_->height = height_;
    ret = av_frame_get_buffer(yuv_frame_, 0);
    if (ret < 0) {
      error = "failed to allocate encoder frame buffer: " + AvErrorString(ret);
      return false;
    }

    sws_ctx_ = sws_getContext(width_, height_, AV_PIX_FMT_RGB24,
                              width_, height_, AV_PIX_FMT_YUVJ420P,
                              SWS_BICUBIC, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
      error = "failed to create rgb->yuvj420p scaler";
      return false;
    }
    return true;
  }

  bool Write(const DecodedFrame& frame, const std::string& path, std::string& error) {
    int ret = av_frame_make_writable(yuv_frame_);
    if (ret < 0) {
      error = "encoder frame not writable: " + AvErrorString(ret);
      return false;
    }

    const uint8_t* src_data[4] = {frame.data.data(), nullptr, nullptr, nullptr};
    const int src_linesize[4] = {width_ * 3, 0, 0, 0};
    sws_scale(sws_ctx_, src_data, src_linesize, 0, height_,
              yuv_frame_->data, yuv_frame_->linesize);
    yuv_frame_->pts = next_pts_++;
    yuv_frame_->quality = codec_ctx_->global_quality;

    ret = avcodec_send_frame(codec_ctx_, yuv_frame_);
    if (ret < 0) {
      error = "mjpeg send_frame failed: " + AvErrorString(ret);
      return false;
    }
    // MJPEG is intra-only: each frame produces exactly one packet.
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret < 0) {
      error = "mjpeg receive_packet failed: " + AvErrorString(ret);
      return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(packet_->data), packet_->size);
    out.close();
    av_packet_unref(packet_);
    if (!out) {
      error = "error writing frame file " + path;
      return false;
    }
    return true;
  }

 private:
  int width_;
  int height_;
  int fps_;
  int qscale_;
  int64_t next_pts_ = 0;

  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* yuv_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
};

}  // namespace

FFmpegDecodeEngine::FFmpegDecodeEngine(int jpeg_qscale)
    : jpeg_qscale_(jpeg_qscale) {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);
}

bool FFmpegDecodeEngine::RunResampled(const DecodeRequest& request,
                                      const FrameSink& sink,
                                      int& source_fps, std::string& error) {
  if (request.fps <= 0) {
    error = "target fps must be positive";
    return false;
  }

  DecoderConfig config;
  config.input_uri = request.input_path;
  config.target_width = request.dims.width;
  config.target_height = request.dims.height;

  FFmpegDecoder decoder(config);
  if (!decoder.Open()) {
    error = decoder.LastError();
    return false;
  }

  int64_t fps_num = 0;
  int64_t fps_den = 1;
  decoder.GetVideoFrameRate(fps_num, fps_den);
  source_fps = fps_num > 0 ? static_cast<int>((fps_num + fps_den / 2) / fps_den) : 0;

  // tick_time_us(n) = n / fps seconds. Integer math, no drift.
  const int64_t fps = request.fps;
  auto tick_time_us = [fps](int64_t n) { return (n * 1'000'000) / fps; };

  DecodedFrame decoded;
  DecodedFrame held;
  bool held_valid = false;
  int64_t tick_index = 0;
  int64_t frames_decoded = 0;
  int64_t frames_emitted = 0;

  while (decoder.DecodeNextFrame(decoded)) {
    frames_decoded++;
    if (!held_valid) {
      // Anchor the tick grid so the first frame covers the tick containing it.
      tick_index = decoded.pts_us > 0 ? (decoded.pts_us * fps) / 1'000'000 : 0;
      std::swap(held, decoded);
      held_valid = true;
      continue;
    }

    // Every tick strictly before this frame belongs to the held frame.
    while (tick_time_us(tick_index) < decoded.pts_us) {
      if (!sink(held, error)) return false;
      ++tick_index;
      ++frames_emitted;
    }
    std::swap(held, decoded);
  }

  if (!decoder.IsEOF()) {
    error = decoder.LastError();
    return false;
  }

  if (held_valid) {
    int64_t duration_us = decoder.SourceFrameDurationUs();
    if (duration_us <= 0) {
      duration_us = tick_time_us(1);
    }
    const int64_t end_us = held.pts_us + duration_us;
    while (tick_time_us(tick_index) < end_us) {
      if (!sink(held, error)) return false;
      ++tick_index;
      ++frames_emitted;
    }
  }

  std::ostringstream oss;
  oss << "[FFmpegDecodeEngine] DECODE_DONE uri=" << request.input_path
      << " source_fps=" << fps_num << "/" << fps_den
      << " target_fps=" << fps
      << " decoded=" << frames_decoded
      << " emitted=" << frames_emitted
      << " skipped_packets=" << decoder.DecodeErrors();
  Logger::Debug(oss.str());
  return true;
}

DecodeResult FFmpegDecodeEngine::DecodeRaw(const DecodeRequest& request) {
  chunking::FrameStream frames;
  auto sink = [&frames](const DecodedFrame& frame, std::string&) {
    frames.raw.insert(frames.raw.end(), frame.data.begin(), frame.data.end());
    return true;
  };

  int source_fps = 0;
  std::string error;
  if (!RunResampled(request, sink, source_fps, error)) {
    return DecodeResult::Failure("error extracting raw frames: " + error);
  }
  return DecodeResult::Success(std::move(frames), source_fps);
}

DecodeResult FFmpegDecodeEngine::DecodeToImages(const DecodeRequest& request,
                                                const std::string& output_dir) {
  JpegFrameWriter writer(request.dims.width, request.dims.height,
                         request.fps > 0 ? request.fps : 1, jpeg_qscale_);
  std::string error;
  if (!writer.Open(error)) {
    return DecodeResult::Failure("error extracting jpeg frames: " + error);
  }

  chunking::FrameStream frames;
  auto sink = [&frames, &writer, &output_dir](const DecodedFrame& frame,
                                              std::string& sink_error) {
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%06zu.jpg", frames.frame_files.size() + 1);
    std::string path = output_dir + "/" + name;
    if (!writer.Write(frame, path, sink_error)) {
      return false;
    }
    frames.frame_files.push_back(std::move(path));
    return true;
  };

  int source_fps = 0;
  if (!RunResampled(request, sink, source_fps, error)) {
    return DecodeResult::Failure("error extracting jpeg frames: " + error);
  }

  // Black frame for padded tails.
  DecodedFrame zero;
  zero.width = request.dims.width;
  zero.height = request.dims.height;
  zero.data.assign(static_cast<size_t>(request.dims.FrameBytes()), 0);
  const std::string zero_path = output_dir + "/zero_frame.jpg";
  if (!writer.Write(zero, zero_path, error)) {
    return DecodeResult::Failure("error writing zero frame: " + error);
  }
  frames.zero_frame_file = zero_path;
  return DecodeResult::Success(std::move(frames), source_fps);
}

}  // namespace clipshard::decode
