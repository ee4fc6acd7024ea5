// Repository: RetroVue-clipshard
// Component: Clip Chunk Serializer
// Purpose: Write a clip's planned chunks as .npy tensors or JPEG directories.
// Copyright (c) 2026 RetroVue

#include "clipshard/chunking/ClipChunkSerializer.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "clipshard/format/NpyWriter.hpp"
#include "clipshard/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipshard::chunking {

using util::Logger;

namespace {

format::ChunkMetadata MakeMetadata(const ChunkContext& context,
                                   const ChunkPlan& plan,
                                   const ChunkRange& range,
                                   int64_t chunk_index) {
  format::ChunkMetadata metadata;
  metadata.key = format::ChunkMetadataKey(context.clip_key, chunk_index);
  metadata.fps = context.fps;
  metadata.frame_count = plan.target_frames;
  metadata.height = context.dims.height;
  metadata.width = context.dims.width;
  metadata.is_padded = range.is_padded;
  metadata.is_trimmed = range.is_trimmed;
  metadata.original_fps = context.original_fps;
  return metadata;
}

SerializeResult FrameCountMismatch(int64_t available, const ChunkPlan& plan) {
  std::ostringstream detail;
  detail << "frame stream holds " << available << " frames, plan expects "
         << plan.total_frames;
  return SerializeResult::Failure(ChunkError::kShapeMismatch, detail.str());
}

}  // namespace

// =============================================================================
// NpyChunkSerializer
// =============================================================================

SerializeResult NpyChunkSerializer::Serialize(const ChunkContext& context,
                                              FrameStream& frames,
                                              const ChunkPlan& plan) {
  const int64_t frame_bytes = context.dims.FrameBytes();
  if (frame_bytes <= 0) {
    return SerializeResult::Failure(ChunkError::kShapeMismatch,
                                    "invalid frame size " + context.dims.ToString());
  }
  if (static_cast<int64_t>(frames.raw.size()) % frame_bytes != 0) {
    std::ostringstream detail;
    detail << "raw buffer length " << frames.raw.size()
           << " is not a multiple of frame size " << frame_bytes
           << " (" << context.dims.ToString() << "x" << kRgbChannels << ")";
    return SerializeResult::Failure(ChunkError::kShapeMismatch, detail.str());
  }
  const int64_t available = frames.FrameCount(frame_bytes);
  if (available != plan.total_frames) {
    return FrameCountMismatch(available, plan);
  }

  const std::vector<int64_t> shape = {plan.target_frames, context.dims.height,
                                      context.dims.width, kRgbChannels};
  const size_t chunk_bytes = static_cast<size_t>(plan.target_frames * frame_bytes);

  std::vector<ChunkArtifact> artifacts;
  artifacts.reserve(plan.ranges.size());
  std::vector<uint8_t> padded;

  for (size_t i = 0; i < plan.ranges.size(); ++i) {
    const ChunkRange& range = plan.ranges[i];
    const int64_t chunk_index = static_cast<int64_t>(i);
    const std::string name = ChunkName(chunk_index);

    const uint8_t* slice = frames.raw.data() + range.start_frame * frame_bytes;
    const size_t slice_bytes = static_cast<size_t>(range.FrameCount() * frame_bytes);
    if (range.is_padded) {
      padded.assign(chunk_bytes, 0);
      std::copy(slice, slice + slice_bytes, padded.begin());
      slice = padded.data();
    }

    ChunkArtifact artifact;
    artifact.chunk_index = chunk_index;
    artifact.path = context.clip_dir + "/" + name + ".npy";
    artifact.metadata_path = context.clip_dir + "/" + name + "_metadata.json";
    artifact.metadata = MakeMetadata(context, plan, range, chunk_index);

    auto status = format::WriteNpyFile(artifact.path, slice, chunk_bytes, shape);
    if (!status.ok) {
      return SerializeResult::Failure(status.error, status.detail);
    }
    status = format::WriteChunkMetadata(artifact.metadata_path, artifact.metadata);
    if (!status.ok) {
      return SerializeResult::Failure(status.error, status.detail);
    }

    Logger::Debug("[NpyChunkSerializer] CHUNK_WRITTEN path=" + artifact.path);
    artifacts.push_back(std::move(artifact));
  }

  // The stream is consumed.
  frames.raw.clear();
  frames.raw.shrink_to_fit();
  return SerializeResult::Success(std::move(artifacts));
}

// =============================================================================
// ImageChunkSerializer
// =============================================================================

SerializeResult ImageChunkSerializer::Serialize(const ChunkContext& context,
                                                FrameStream& frames,
                                                const ChunkPlan& plan) {
  // Sort order is temporal order.
  std::vector<std::string> files = std::move(frames.frame_files);
  frames.frame_files.clear();
  const std::string zero_frame = std::move(frames.zero_frame_file);
  frames.zero_frame_file.clear();
  std::sort(files.begin(), files.end());

  const int64_t available = static_cast<int64_t>(files.size());
  if (available != plan.total_frames) {
    return FrameCountMismatch(available, plan);
  }

  std::vector<ChunkArtifact> artifacts;
  artifacts.reserve(plan.ranges.size());
  std::error_code ec;

  for (size_t i = 0; i < plan.ranges.size(); ++i) {
    const ChunkRange& range = plan.ranges[i];
    const int64_t chunk_index = static_cast<int64_t>(i);

    ChunkArtifact artifact;
    artifact.chunk_index = chunk_index;
    artifact.path = context.clip_dir + "/" + ChunkName(chunk_index);
    artifact.metadata_path = artifact.path + "/metadata.json";
    artifact.metadata = MakeMetadata(context, plan, range, chunk_index);

    fs::create_directories(artifact.path, ec);
    if (ec) {
      return SerializeResult::Failure(
          ChunkError::kFilesystem,
          "error creating chunk directory " + artifact.path + ": " + ec.message());
    }

    int64_t position = 1;
    for (int64_t f = range.start_frame; f < range.end_frame; ++f, ++position) {
      const fs::path src(files[static_cast<size_t>(f)]);
      const std::string dst = artifact.path + "/" + ChunkFrameName(position) +
                              src.extension().string();
      fs::rename(src, dst, ec);
      if (ec) {
        return SerializeResult::Failure(
            ChunkError::kFilesystem,
            "error moving " + src.string() + " to " + dst + ": " + ec.message());
      }
    }

    // Short tail: zero frames up to the chunk length.
    if (range.is_padded) {
      if (zero_frame.empty()) {
        return SerializeResult::Failure(
            ChunkError::kShapeMismatch,
            "no zero frame available to pad " + artifact.path);
      }
      const std::string ext = fs::path(zero_frame).extension().string();
      for (; position <= plan.target_frames; ++position) {
        const std::string dst = artifact.path + "/" + ChunkFrameName(position) + ext;
        fs::copy_file(zero_frame, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
          return SerializeResult::Failure(
              ChunkError::kFilesystem,
              "error padding " + dst + ": " + ec.message());
        }
      }
    }

    auto status = format::WriteChunkMetadata(artifact.metadata_path, artifact.metadata);
    if (!status.ok) {
      return SerializeResult::Failure(status.error, status.detail);
    }

    Logger::Debug("[ImageChunkSerializer] CHUNK_WRITTEN path=" + artifact.path);
    artifacts.push_back(std::move(artifact));
  }

  // Frames no range accepted (truncate remainder) are deleted.
  const int64_t used = plan.ranges.empty() ? 0 : plan.ranges.back().end_frame;
  for (int64_t f = used; f < available; ++f) {
    fs::remove(files[static_cast<size_t>(f)], ec);
    if (ec) {
      return SerializeResult::Failure(
          ChunkError::kFilesystem,
          "error removing discarded frame " + files[static_cast<size_t>(f)] + ": " +
              ec.message());
    }
  }
  if (!zero_frame.empty()) {
    fs::remove(zero_frame, ec);
    if (ec) {
      return SerializeResult::Failure(
          ChunkError::kFilesystem,
          "error removing zero frame " + zero_frame + ": " + ec.message());
    }
  }

  return SerializeResult::Success(std::move(artifacts));
}

std::unique_ptr<IChunkSerializer> MakeChunkSerializer(OutputFormat format) {
  switch (format) {
    case OutputFormat::kNpy:
      return std::make_unique<NpyChunkSerializer>();
    case OutputFormat::kJpeg:
      return std::make_unique<ImageChunkSerializer>();
  }
  return nullptr;
}

}  // namespace clipshard::chunking
