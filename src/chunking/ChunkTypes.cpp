// Repository: RetroVue-clipshard
// Component: Chunking Types Implementation
// Copyright (c) 2026 RetroVue

#include "clipshard/chunking/ChunkTypes.hpp"

#include <cctype>
#include <cstdio>
#include <limits>

namespace clipshard::chunking {

const char* ChunkErrorToString(ChunkError error) {
  switch (error) {
    case ChunkError::kNone:
      return "NONE";
    case ChunkError::kInvalidSize:
      return "INVALID_SIZE";
    case ChunkError::kInvalidChunkLength:
      return "INVALID_CHUNK_LENGTH";
    case ChunkError::kInvalidFormat:
      return "INVALID_FORMAT";
    case ChunkError::kInvalidFps:
      return "INVALID_FPS";
    case ChunkError::kInvalidWorkerCount:
      return "INVALID_WORKER_COUNT";
    case ChunkError::kInvalidShardSize:
      return "INVALID_SHARD_SIZE";
    case ChunkError::kInvalidLogLevel:
      return "INVALID_LOG_LEVEL";
    case ChunkError::kDecodeFailed:
      return "DECODE_FAILED";
    case ChunkError::kShapeMismatch:
      return "SHAPE_MISMATCH";
    case ChunkError::kChunkIndexOverflow:
      return "CHUNK_INDEX_OVERFLOW";
    case ChunkError::kFilesystem:
      return "FILESYSTEM";
    case ChunkError::kArchive:
      return "ARCHIVE";
  }
  return "UNKNOWN_ERROR";
}

const char* OutputFormatName(OutputFormat format) {
  switch (format) {
    case OutputFormat::kJpeg:
      return "jpg";
    case OutputFormat::kNpy:
      return "npy";
  }
  return "unknown";
}

std::optional<OutputFormat> ParseOutputFormat(const std::string& name) {
  if (name == "jpg") return OutputFormat::kJpeg;
  if (name == "npy") return OutputFormat::kNpy;
  return std::nullopt;
}

const char* PadPolicyName(PadPolicy policy) {
  switch (policy) {
    case PadPolicy::kTruncate:
      return "truncate";
    case PadPolicy::kPad:
      return "pad";
  }
  return "unknown";
}

std::string Dimensions::ToString() const {
  return std::to_string(width) + "x" + std::to_string(height);
}

namespace {

// Positive decimal integer that fits in int. No sign, no whitespace.
bool ParsePositiveInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  int64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
    if (value > std::numeric_limits<int>::max()) return false;
  }
  if (value <= 0) return false;
  out = static_cast<int>(value);
  return true;
}

}  // namespace

DimensionsResult ParseDimensions(const std::string& size) {
  const size_t sep = size.find('x');
  if (sep == std::string::npos || size.find('x', sep + 1) != std::string::npos) {
    return DimensionsResult::Failure("invalid size format: " + size);
  }

  const std::string width_text = size.substr(0, sep);
  const std::string height_text = size.substr(sep + 1);

  Dimensions dims;
  if (!ParsePositiveInt(width_text, dims.width)) {
    return DimensionsResult::Failure("invalid width: " + width_text);
  }
  if (!ParsePositiveInt(height_text, dims.height)) {
    return DimensionsResult::Failure("invalid height: " + height_text);
  }
  return DimensionsResult::Success(dims);
}

std::string ChunkName(int64_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "chunk_%0*lld", kChunkIndexDigits,
                static_cast<long long>(index));
  return buf;
}

std::string ChunkFrameName(int64_t position) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "frame_%0*lld", kChunkFrameDigits,
                static_cast<long long>(position));
  return buf;
}

std::string ChunkStatus::Describe() const {
  if (ok) return "OK";
  std::string out = ChunkErrorToString(error);
  if (!detail.empty()) {
    out += ": ";
    out += detail;
  }
  return out;
}

}  // namespace clipshard::chunking
