// Repository: RetroVue-clipshard
// Component: Clip Pipeline
// Purpose: Per-clip driver: temp input, decode, plan, serialize, cleanup.
// Copyright (c) 2026 RetroVue

#include "clipshard/pipeline/ClipPipeline.hpp"

#include <filesystem>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>

#include "clipshard/chunking/ChunkPlanner.hpp"
#include "clipshard/chunking/ClipChunkSerializer.hpp"
#include "clipshard/pipeline/ScopedTempFile.hpp"
#include "clipshard/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipshard::pipeline {

using chunking::ChunkError;
using chunking::ChunkStatus;
using chunking::OutputFormat;
using util::Logger;

namespace {

constexpr const char* kStagingDirName = ".frames";
constexpr const char* kTempExtension = ".mp4";

ClipResult Fail(ChunkError error, const std::string& detail) {
  ClipResult result;
  result.status = ChunkStatus::Failure(error, detail);
  return result;
}

// Removes the image staging directory when the clip scope exits.
class StagingDirGuard {
 public:
  explicit StagingDirGuard(std::string path) : path_(std::move(path)) {}
  ~StagingDirGuard() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      Logger::Warn("[ClipPipeline] STAGING_REMOVE_FAILED path=" + path_ +
                   " error=" + ec.message());
    }
  }
  StagingDirGuard(const StagingDirGuard&) = delete;
  StagingDirGuard& operator=(const StagingDirGuard&) = delete;

 private:
  std::string path_;
};

}  // namespace

bool IsSafeClipKey(const std::string& key) {
  if (key.empty() || key == "." || key == "..") return false;
  if (key.find('/') != std::string::npos) return false;
  if (key.find('\\') != std::string::npos) return false;
  return key.find("..") == std::string::npos;
}

ClipPipeline::ClipPipeline(decode::IDecodeEngine& engine, PipelineParams params)
    : engine_(engine), params_(std::move(params)) {}

ClipResult ClipPipeline::Process(const chunking::Clip& clip) const {
  if (!IsSafeClipKey(clip.key)) {
    return Fail(ChunkError::kFilesystem, "unsafe clip key '" + clip.key + "'");
  }

  ScopedTempFile input;
  auto status = input.Write(params_.temp_dir, clip.key, kTempExtension, clip.data);
  if (!status.ok) {
    return Fail(status.error, status.detail);
  }

  const std::string clip_dir = (fs::path(params_.output_dir) / clip.key).string();
  std::error_code ec;
  fs::create_directories(clip_dir, ec);
  if (ec) {
    return Fail(ChunkError::kFilesystem,
                "error creating output directory " + clip_dir + ": " + ec.message());
  }

  decode::DecodeRequest request;
  request.input_path = input.path();
  request.fps = params_.fps;
  request.dims = params_.dims;

  decode::DecodeResult decoded = decode::DecodeResult::Failure("not run");
  std::unique_ptr<StagingDirGuard> staging_guard;
  if (params_.format == OutputFormat::kNpy) {
    decoded = engine_.DecodeRaw(request);
  } else {
    const std::string staging = (fs::path(clip_dir) / kStagingDirName).string();
    fs::create_directories(staging, ec);
    if (ec) {
      return Fail(ChunkError::kFilesystem,
                  "error creating staging directory " + staging + ": " + ec.message());
    }
    staging_guard = std::make_unique<StagingDirGuard>(staging);
    decoded = engine_.DecodeToImages(request, staging);
  }
  if (!decoded.ok) {
    return Fail(ChunkError::kDecodeFailed, decoded.error);
  }

  const int64_t frame_bytes = params_.dims.FrameBytes();
  if (params_.format == OutputFormat::kNpy && frame_bytes > 0 &&
      static_cast<int64_t>(decoded.frames.raw.size()) % frame_bytes != 0) {
    std::ostringstream detail;
    detail << "decoded buffer length " << decoded.frames.raw.size()
           << " is not a multiple of frame size " << frame_bytes;
    return Fail(ChunkError::kShapeMismatch, detail.str());
  }
  const int64_t total_frames = decoded.frames.FrameCount(frame_bytes);

  auto planned = chunking::ChunkPlanner::Plan(total_frames, params_.target_frames,
                                              params_.policy);
  if (!planned.valid) {
    return Fail(planned.error, planned.detail);
  }

  chunking::ChunkContext context;
  context.clip_key = clip.key;
  context.clip_dir = clip_dir;
  context.fps = params_.fps;
  context.dims = params_.dims;
  context.original_fps = decoded.source_fps;

  auto serializer = chunking::MakeChunkSerializer(params_.format);
  auto serialized = serializer->Serialize(context, decoded.frames, planned.plan);
  if (!serialized.ok) {
    return Fail(serialized.error, serialized.detail);
  }

  ClipResult result;
  result.status = ChunkStatus::Success();
  result.frames_decoded = total_frames;
  result.chunks_written = static_cast<int64_t>(serialized.artifacts.size());
  result.frames_discarded = planned.plan.discarded_frames;

  std::ostringstream oss;
  oss << "[ClipPipeline] CLIP_DONE key=" << clip.key
      << " frames=" << result.frames_decoded
      << " chunks=" << result.chunks_written
      << " discarded=" << result.frames_discarded
      << " source_fps=" << decoded.source_fps;
  Logger::Info(oss.str());
  return result;
}

}  // namespace clipshard::pipeline
