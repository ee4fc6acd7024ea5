// Repository: RetroVue-clipshard
// Component: Tar Writer
// Purpose: Minimal POSIX ustar archive writer.
// Copyright (c) 2026 RetroVue

#include "clipshard/archive/TarWriter.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iterator>

#include "TarHeader.hpp"

namespace clipshard::archive {

using chunking::ChunkError;
using chunking::ChunkStatus;

namespace {

constexpr uint64_t kMaxOctalSize = 077777777777ULL;  // 11 octal digits

void PutString(uint8_t* block, TarField field, const std::string& value) {
  std::memcpy(block + field.offset, value.data(),
              std::min(value.size(), field.length));
}

// Zero-padded octal with a trailing NUL, filling the field.
void PutOctal(uint8_t* block, TarField field, uint64_t value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*llo", static_cast<int>(field.length - 1),
                static_cast<unsigned long long>(value));
  std::memcpy(block + field.offset, buf, field.length - 1);
  block[field.offset + field.length - 1] = '\0';
}

// Splits name into (prefix, name) fitting 155/100 bytes. False when no '/'
// gives a valid split.
bool SplitUstarName(const std::string& full, std::string& prefix, std::string& name) {
  if (full.size() <= kTarName.length) {
    prefix.clear();
    name = full;
    return true;
  }
  for (size_t slash = full.find('/'); slash != std::string::npos;
       slash = full.find('/', slash + 1)) {
    if (slash > kTarPrefix.length) break;
    const size_t rest = full.size() - slash - 1;
    if (rest > 0 && rest <= kTarName.length) {
      prefix = full.substr(0, slash);
      name = full.substr(slash + 1);
      return true;
    }
  }
  return false;
}

}  // namespace

ChunkStatus TarWriter::Open(const std::string& path) {
  path_ = path;
  entry_count_ = 0;
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_) {
    return ChunkStatus::Failure(ChunkError::kArchive,
                                "error creating tar file " + path + ": " +
                                    std::strerror(errno));
  }
  return ChunkStatus::Success();
}

ChunkStatus TarWriter::WriteFailure(const std::string& what) {
  return ChunkStatus::Failure(ChunkError::kArchive,
                              "error writing " + what + " to " + path_);
}

ChunkStatus TarWriter::AddFile(const std::string& name, const uint8_t* data,
                               size_t size) {
  if (!out_.is_open()) {
    return ChunkStatus::Failure(ChunkError::kArchive, "tar writer not open");
  }
  std::string prefix;
  std::string short_name;
  if (name.empty() || !SplitUstarName(name, prefix, short_name)) {
    return ChunkStatus::Failure(ChunkError::kArchive,
                                "tar entry name cannot be encoded: " + name);
  }
  if (size > kMaxOctalSize) {
    return ChunkStatus::Failure(ChunkError::kArchive,
                                "tar entry too large: " + name);
  }

  uint8_t block[kTarBlockSize] = {};
  PutString(block, kTarName, short_name);
  PutOctal(block, kTarMode, 0644);
  PutOctal(block, kTarUid, 0);
  PutOctal(block, kTarGid, 0);
  PutOctal(block, kTarSize, size);
  PutOctal(block, kTarMtime, 0);
  block[kTarTypeflag.offset] = static_cast<uint8_t>(kTarTypeRegular);
  PutString(block, kTarMagic, std::string("ustar\0", 6));
  PutString(block, kTarVersion, "00");
  PutString(block, kTarPrefix, prefix);

  // Checksum: six octal digits, NUL, space.
  char checksum[8];
  std::snprintf(checksum, sizeof(checksum), "%06o", ComputeTarChecksum(block));
  std::memcpy(block + kTarChecksum.offset, checksum, 6);
  block[kTarChecksum.offset + 6] = '\0';
  block[kTarChecksum.offset + 7] = ' ';

  out_.write(reinterpret_cast<const char*>(block), kTarBlockSize);
  if (size > 0) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  }
  static const char kZeros[kTarBlockSize] = {};
  out_.write(kZeros, static_cast<std::streamsize>(TarPadding(size)));
  if (!out_) {
    return WriteFailure(name);
  }
  ++entry_count_;
  return ChunkStatus::Success();
}

ChunkStatus TarWriter::AddFileFromDisk(const std::string& name,
                                       const std::string& source_path) {
  std::ifstream in(source_path, std::ios::binary);
  if (!in) {
    return ChunkStatus::Failure(ChunkError::kArchive,
                                "error reading file " + source_path + ": " +
                                    std::strerror(errno));
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
  if (in.bad()) {
    return ChunkStatus::Failure(ChunkError::kArchive,
                                "error reading file " + source_path);
  }
  return AddFile(name, data);
}

ChunkStatus TarWriter::Finish() {
  if (!out_.is_open()) {
    return ChunkStatus::Failure(ChunkError::kArchive, "tar writer not open");
  }
  static const char kZeros[2 * kTarBlockSize] = {};
  out_.write(kZeros, sizeof(kZeros));
  out_.close();
  if (!out_) {
    return WriteFailure("end blocks");
  }
  return ChunkStatus::Success();
}

}  // namespace clipshard::archive
