// Repository: RetroVue-clipshard
// Component: Scoped Temp File
// Purpose: Temporary on-disk copy of an in-memory clip, removed on destruction.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_PIPELINE_SCOPED_TEMP_FILE_HPP_
#define CLIPSHARD_PIPELINE_SCOPED_TEMP_FILE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::pipeline {

// Owns one file path. The file is deleted when the object is destroyed,
// whichever way the owning scope exits.
class ScopedTempFile {
 public:
  ScopedTempFile() = default;
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  // Writes data to <dir>/<pid>_<stem><extension>. An empty dir means the
  // system temp directory. May be called once.
  chunking::ChunkStatus Write(const std::string& dir, const std::string& stem,
                              const std::string& extension,
                              const std::vector<uint8_t>& data);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace clipshard::pipeline

#endif  // CLIPSHARD_PIPELINE_SCOPED_TEMP_FILE_HPP_
