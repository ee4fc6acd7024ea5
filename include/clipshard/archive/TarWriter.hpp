// Repository: RetroVue-clipshard
// Component: Tar Writer
// Purpose: Minimal POSIX ustar archive writer.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_ARCHIVE_TAR_WRITER_HPP_
#define CLIPSHARD_ARCHIVE_TAR_WRITER_HPP_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::archive {

// Writes regular-file entries (mode 0644, uid/gid 0, mtime 0). Names longer
// than 100 bytes are split into the ustar prefix/name pair at a '/'; names
// that cannot be split are rejected with kArchive.
//
// The archive is only valid after Finish(). A writer destroyed without
// Finish() leaves an unterminated file behind.
class TarWriter {
 public:
  TarWriter() = default;
  ~TarWriter() = default;

  TarWriter(const TarWriter&) = delete;
  TarWriter& operator=(const TarWriter&) = delete;

  chunking::ChunkStatus Open(const std::string& path);

  chunking::ChunkStatus AddFile(const std::string& name, const uint8_t* data,
                                size_t size);
  chunking::ChunkStatus AddFile(const std::string& name,
                                const std::vector<uint8_t>& data) {
    return AddFile(name, data.data(), data.size());
  }

  // Reads source_path from disk and stores it under name.
  chunking::ChunkStatus AddFileFromDisk(const std::string& name,
                                        const std::string& source_path);

  // Writes the two zero end-of-archive blocks and closes the file.
  chunking::ChunkStatus Finish();

  int64_t entry_count() const { return entry_count_; }

 private:
  chunking::ChunkStatus WriteFailure(const std::string& what);

  std::ofstream out_;
  std::string path_;
  int64_t entry_count_ = 0;
};

}  // namespace clipshard::archive

#endif  // CLIPSHARD_ARCHIVE_TAR_WRITER_HPP_
