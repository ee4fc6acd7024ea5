// Repository: RetroVue-clipshard
// Component: FFmpeg Decoder
// Purpose: Video decoding to packed RGB24 using libavformat/libavcodec.
// Copyright (c) 2026 RetroVue

#include "clipshard/decode/FFmpegDecoder.hpp"

#include <sstream>

#include "clipshard/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace clipshard::decode {

using util::Logger;

FFmpegDecoder::FFmpegDecoder(const DecoderConfig& config)
    : config_(config) {}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

void FFmpegDecoder::SetError(const std::string& step, int ret) {
  std::ostringstream oss;
  oss << step << " failed uri=" << config_.input_uri;
  if (ret < 0) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, errbuf, sizeof(errbuf));
    oss << " ret=" << ret << " err=" << errbuf;
  }
  last_error_ = oss.str();
  Logger::Debug("[FFmpegDecoder] DECODER_STEP " + last_error_);
}

bool FFmpegDecoder::Open() {
  Logger::Debug("[FFmpegDecoder] Opening: " + config_.input_uri);

  // Open input file (DECODER_STEP: open_input)
  // On failure avformat_open_input frees the context and nulls the pointer.
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    SetError("open_input", ret);
    format_ctx_ = nullptr;
    return false;
  }

  // Retrieve stream information (DECODER_STEP: find_stream_info)
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    SetError("find_stream_info", ret);
    Close();
    return false;
  }

  // Find video stream (DECODER_STEP: find_video_stream)
  if (!FindVideoStream()) {
    SetError("find_video_stream (no video stream)", 0);
    Close();
    return false;
  }

  // Initialize codec (DECODER_STEP: initialize_codec)
  if (!InitializeCodec()) {
    Close();
    return false;
  }

  // Allocate packet (DECODER_STEP: packet_alloc)
  packet_ = av_packet_alloc();
  if (!packet_) {
    SetError("packet_alloc", 0);
    Close();
    return false;
  }

  int64_t fps_num = 0;
  int64_t fps_den = 1;
  GetVideoFrameRate(fps_num, fps_den);
  std::ostringstream oss;
  oss << "[FFmpegDecoder] DECODER_STEP open_input OK uri=" << config_.input_uri
      << " " << codec_ctx_->width << "x" << codec_ctx_->height
      << " @ " << fps_num << "/" << fps_den << " fps";
  Logger::Debug(oss.str());
  return true;
}

void FFmpegDecoder::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  if (frame_) {
    av_frame_free(&frame_);
  }

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  video_stream_index_ = -1;
  demux_eof_ = false;
  last_pts_us_ = -1;
}

bool FFmpegDecoder::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      video_stream_index_ = static_cast<int>(i);

      AVStream* stream = format_ctx_->streams[i];
      start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

      return true;
    }
  }

  return false;
}

bool FFmpegDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  // Find decoder
  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    SetError("find_decoder codec_id=" + std::to_string(codecpar->codec_id), 0);
    return false;
  }

  // Allocate codec context
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    SetError("alloc_codec_context", 0);
    return false;
  }

  // Copy codec parameters
  int ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) {
    SetError("parameters_to_context", ret);
    return false;
  }

  // Clips are decoded in parallel by the worker pool; keep per-decoder
  // threading modest unless configured otherwise.
  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  // Open codec
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    SetError("open_codec", ret);
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    SetError("frame_alloc", 0);
    return false;
  }

  return true;
}

bool FFmpegDecoder::EnsureScaler(const AVFrame* av_frame) {
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_,
      av_frame->width, av_frame->height, static_cast<AVPixelFormat>(av_frame->format),
      config_.target_width, config_.target_height, AV_PIX_FMT_RGB24,
      SWS_BICUBIC, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    SetError("initialize_scaler", 0);
    return false;
  }
  return true;
}

bool FFmpegDecoder::DecodeNextFrame(DecodedFrame& output_frame) {
  if (!IsOpen() || eof_reached_) {
    return false;
  }

  while (true) {
    // Drain whatever the codec already holds before feeding it more input.
    const int got = ReceiveFrame(output_frame);
    if (got > 0) return true;
    if (got < 0) return false;

    if (demux_eof_) {
      // Codec fully flushed.
      eof_reached_ = true;
      return false;
    }

    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      demux_eof_ = true;
      // Null packet puts the codec in draining mode.
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (ret < 0) {
      SetError("read_frame", ret);
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0) {
      // Corrupt packet: skip it, keep decoding.
      decode_errors_++;
      char errbuf[AV_ERROR_MAX_STRING_SIZE];
      av_strerror(ret, errbuf, sizeof(errbuf));
      Logger::Debug(std::string("[FFmpegDecoder] send_packet rejected: ") + errbuf);
    }
  }
}

int FFmpegDecoder::ReceiveFrame(DecodedFrame& output_frame) {
  const int ret = avcodec_receive_frame(codec_ctx_, frame_);
  if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
    return 0;
  }
  if (ret < 0) {
    SetError("receive_frame", ret);
    return -1;
  }
  const bool converted = ConvertFrame(frame_, output_frame);
  av_frame_unref(frame_);
  return converted ? 1 : -1;
}

bool FFmpegDecoder::ConvertFrame(AVFrame* av_frame, DecodedFrame& output_frame) {
  if (!EnsureScaler(av_frame)) {
    return false;
  }

  output_frame.width = config_.target_width;
  output_frame.height = config_.target_height;
  output_frame.data.resize(static_cast<size_t>(config_.target_width) *
                           config_.target_height * 3);

  uint8_t* dst_data[4] = {output_frame.data.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {config_.target_width * 3, 0, 0, 0};
  sws_scale(sws_ctx_,
            av_frame->data, av_frame->linesize, 0, av_frame->height,
            dst_data, dst_linesize);

  // Presentation time in microseconds relative to stream start.
  int64_t pts = av_frame->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) {
    pts = av_frame->pts;
  }
  if (pts != AV_NOPTS_VALUE) {
    AVStream* stream = format_ctx_->streams[video_stream_index_];
    output_frame.pts_us = av_rescale_q(pts - start_time_, stream->time_base,
                                       AVRational{1, 1000000});
  } else {
    output_frame.pts_us = last_pts_us_ < 0 ? 0 : last_pts_us_ + SourceFrameDurationUs();
  }
  last_pts_us_ = output_frame.pts_us;
  return true;
}

void FFmpegDecoder::GetVideoFrameRate(int64_t& num, int64_t& den) const {
  num = 0;
  den = 1;
  if (!format_ctx_ || video_stream_index_ < 0) return;

  // r_frame_rate is the container/codec nominal rate.
  AVRational fps = format_ctx_->streams[video_stream_index_]->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) return;
  num = fps.num;
  den = fps.den;
}

int64_t FFmpegDecoder::SourceFrameDurationUs() const {
  int64_t num = 0;
  int64_t den = 1;
  GetVideoFrameRate(num, den);
  return num > 0 ? (1000000LL * den) / num : 0;
}

}  // namespace clipshard::decode
