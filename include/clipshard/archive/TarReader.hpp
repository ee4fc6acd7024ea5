// Repository: RetroVue-clipshard
// Component: Tar Reader
// Purpose: Sequential ustar/GNU tar reader and video clip extraction.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_ARCHIVE_TAR_READER_HPP_
#define CLIPSHARD_ARCHIVE_TAR_READER_HPP_

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"
#include "clipshard/chunking/Clip.hpp"

namespace clipshard::archive {

struct TarEntry {
  std::string name;   // full path inside the archive
  char type = '0';
  std::vector<uint8_t> data;  // regular files only

  bool IsRegularFile() const { return type == '0' || type == '\0'; }
};

struct ExtractResult {
  bool ok;
  chunking::ChunkError error;
  std::string detail;
  std::vector<chunking::Clip> clips;

  static ExtractResult Success(std::vector<chunking::Clip> c) {
    return {true, chunking::ChunkError::kNone, "", std::move(c)};
  }

  static ExtractResult Failure(const std::string& detail) {
    return {false, chunking::ChunkError::kArchive, detail, {}};
  }
};

class TarReader {
 public:
  enum class NextStatus { kEntry, kEnd, kError };

  TarReader() = default;
  ~TarReader() = default;

  TarReader(const TarReader&) = delete;
  TarReader& operator=(const TarReader&) = delete;

  bool Open(const std::string& path);

  // Reads the next entry. GNU long-name and pax records are folded into the
  // entry they describe and never returned themselves. Data of non-regular
  // entries is skipped.
  NextStatus Next(TarEntry& entry);

  const std::string& LastError() const { return last_error_; }

  // Video clips of an archive, in archive order. The key is the base name
  // without extension. Dot-prefixed base names and non-video entries are
  // skipped; duplicate keys keep the first occurrence.
  static ExtractResult ExtractClips(const std::string& path);

 private:
  bool ReadBlock(uint8_t* block);
  bool ReadPayload(int64_t size, std::vector<uint8_t>& out);
  bool SkipPayload(int64_t size);
  NextStatus Fail(const std::string& error);

  std::ifstream in_;
  std::string path_;
  std::string last_error_;
  int64_t entries_read_ = 0;
};

// ".mp4", ".mov", ".mkv", ".webm", ".avi" in any letter case.
bool IsVideoFileName(const std::string& name);

}  // namespace clipshard::archive

#endif  // CLIPSHARD_ARCHIVE_TAR_READER_HPP_
