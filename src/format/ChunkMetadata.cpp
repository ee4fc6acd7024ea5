// Repository: RetroVue-clipshard
// Component: Chunk Metadata
// Purpose: JSON sidecar describing one written chunk.
// Copyright (c) 2026 RetroVue

#include "clipshard/format/ChunkMetadata.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>

#include "clipshard/util/JsonFields.hpp"

namespace clipshard::format {

using chunking::ChunkError;
using chunking::ChunkStatus;

using util::ExtractBool;
using util::ExtractInt;
using util::ExtractString;
using util::JsonEscape;

std::string ChunkMetadata::ToJson() const {
  std::ostringstream oss;
  oss << "{\n"
      << "  \"key\": \"" << JsonEscape(key) << "\",\n"
      << "  \"fps\": " << fps << ",\n"
      << "  \"frame_count\": " << frame_count << ",\n"
      << "  \"size\": [\n"
      << "    " << height << ",\n"
      << "    " << width << "\n"
      << "  ]";
  if (is_padded) {
    oss << ",\n  \"is_padded\": true";
  }
  if (is_trimmed) {
    oss << ",\n  \"is_trimmed\": true";
  }
  if (original_fps != 0) {
    oss << ",\n  \"original_fps\": " << original_fps;
  }
  oss << "\n}";
  return oss.str();
}

std::optional<ChunkMetadata> ChunkMetadata::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  ChunkMetadata metadata;
  if (!ExtractString(json_str, "key", metadata.key)) {
    return std::nullopt;
  }

  int64_t value = 0;
  if (!ExtractInt(json_str, "fps", value)) {
    return std::nullopt;
  }
  metadata.fps = static_cast<int>(value);
  if (!ExtractInt(json_str, "frame_count", metadata.frame_count)) {
    return std::nullopt;
  }

  std::regex size_pattern("\"size\"\\s*:\\s*\\[\\s*(\\d{1,9})\\s*,\\s*(\\d{1,9})\\s*\\]");
  std::smatch match;
  if (!std::regex_search(json_str, match, size_pattern)) {
    return std::nullopt;
  }
  metadata.height = std::stoi(match[1].str());
  metadata.width = std::stoi(match[2].str());

  // Optional fields (omitted when false / zero)
  ExtractBool(json_str, "is_padded", metadata.is_padded);
  ExtractBool(json_str, "is_trimmed", metadata.is_trimmed);
  if (ExtractInt(json_str, "original_fps", value)) {
    metadata.original_fps = static_cast<int>(value);
  }
  return metadata;
}

std::string ChunkMetadataKey(const std::string& clip_key, int64_t chunk_index) {
  return clip_key + "/" + chunking::ChunkName(chunk_index);
}

ChunkStatus WriteChunkMetadata(const std::string& path, const ChunkMetadata& metadata) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error creating metadata file " + path + ": " +
                                    std::strerror(errno));
  }
  out << metadata.ToJson();
  out.close();
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error writing metadata file " + path);
  }
  return ChunkStatus::Success();
}

}  // namespace clipshard::format
