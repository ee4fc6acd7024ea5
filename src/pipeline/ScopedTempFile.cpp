// Repository: RetroVue-clipshard
// Component: Scoped Temp File
// Purpose: Temporary on-disk copy of an in-memory clip, removed on destruction.
// Copyright (c) 2026 RetroVue

#include "clipshard/pipeline/ScopedTempFile.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "clipshard/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipshard::pipeline {

using chunking::ChunkError;
using chunking::ChunkStatus;
using util::Logger;

ScopedTempFile::~ScopedTempFile() {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    Logger::Warn("[ScopedTempFile] REMOVE_FAILED path=" + path_ +
                 " error=" + ec.message());
  }
}

ChunkStatus ScopedTempFile::Write(const std::string& dir, const std::string& stem,
                                  const std::string& extension,
                                  const std::vector<uint8_t>& data) {
  if (!path_.empty()) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "temp file already written: " + path_);
  }

  fs::path base;
  if (dir.empty()) {
    std::error_code ec;
    base = fs::temp_directory_path(ec);
    if (ec) {
      return ChunkStatus::Failure(ChunkError::kFilesystem,
                                  "no temp directory: " + ec.message());
    }
  } else {
    base = dir;
  }

  const std::string path =
      (base / (std::to_string(::getpid()) + "_" + stem + extension)).string();

  // Claim the path first so the destructor cleans up a partial write.
  path_ = path;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error creating temp file " + path + ": " +
                                    std::strerror(errno));
  }
  out.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error writing temp file " + path);
  }
  return ChunkStatus::Success();
}

}  // namespace clipshard::pipeline
