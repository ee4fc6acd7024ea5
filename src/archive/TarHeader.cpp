// Repository: RetroVue-clipshard
// Component: Tar Header
// Purpose: ustar header block layout shared by TarReader and TarWriter.
// Copyright (c) 2026 RetroVue

#include "TarHeader.hpp"

namespace clipshard::archive {

std::string ReadTarString(const uint8_t* block, TarField field) {
  const char* begin = reinterpret_cast<const char*>(block + field.offset);
  size_t len = 0;
  while (len < field.length && begin[len] != '\0') ++len;
  return std::string(begin, len);
}

std::optional<int64_t> ReadTarNumber(const uint8_t* block, TarField field) {
  const uint8_t* p = block + field.offset;

  if (p[0] & 0x80) {
    // Base-256, big-endian; only non-negative values are meaningful here.
    if (p[0] & 0x40) return std::nullopt;
    int64_t value = p[0] & 0x3F;
    for (size_t i = 1; i < field.length; ++i) {
      if (value > (INT64_MAX >> 8)) return std::nullopt;
      value = (value << 8) | p[i];
    }
    return value;
  }

  size_t i = 0;
  while (i < field.length && (p[i] == ' ' || p[i] == '\0')) ++i;
  if (i == field.length) return 0;

  int64_t value = 0;
  for (; i < field.length; ++i) {
    const uint8_t c = p[i];
    if (c == ' ' || c == '\0') break;
    if (c < '0' || c > '7') return std::nullopt;
    if (value > (INT64_MAX >> 3)) return std::nullopt;
    value = (value << 3) | (c - '0');
  }
  return value;
}

uint32_t ComputeTarChecksum(const uint8_t* block) {
  uint32_t sum = 0;
  for (size_t i = 0; i < kTarBlockSize; ++i) {
    const bool in_checksum = i >= kTarChecksum.offset &&
                             i < kTarChecksum.offset + kTarChecksum.length;
    sum += in_checksum ? static_cast<uint32_t>(' ') : block[i];
  }
  return sum;
}

bool IsZeroBlock(const uint8_t* block) {
  for (size_t i = 0; i < kTarBlockSize; ++i) {
    if (block[i] != 0) return false;
  }
  return true;
}

}  // namespace clipshard::archive
