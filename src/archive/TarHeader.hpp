// Repository: RetroVue-clipshard
// Component: Tar Header
// Purpose: ustar header block layout shared by TarReader and TarWriter.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_ARCHIVE_TAR_HEADER_HPP_
#define CLIPSHARD_ARCHIVE_TAR_HEADER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace clipshard::archive {

constexpr size_t kTarBlockSize = 512;

// Field offsets and widths within a POSIX ustar header block.
struct TarField {
  size_t offset;
  size_t length;
};

constexpr TarField kTarName{0, 100};
constexpr TarField kTarMode{100, 8};
constexpr TarField kTarUid{108, 8};
constexpr TarField kTarGid{116, 8};
constexpr TarField kTarSize{124, 12};
constexpr TarField kTarMtime{136, 12};
constexpr TarField kTarChecksum{148, 8};
constexpr TarField kTarTypeflag{156, 1};
constexpr TarField kTarMagic{257, 6};
constexpr TarField kTarVersion{263, 2};
constexpr TarField kTarPrefix{345, 155};

constexpr char kTarTypeRegular = '0';
constexpr char kTarTypeRegularOld = '\0';
constexpr char kTarTypeGnuLongName = 'L';
constexpr char kTarTypePaxHeader = 'x';

// NUL-terminated (or full-width) string field.
std::string ReadTarString(const uint8_t* block, TarField field);

// Octal numeric field, or GNU base-256 when the high bit of the first byte
// is set. nullopt when neither parses.
std::optional<int64_t> ReadTarNumber(const uint8_t* block, TarField field);

// Sum of all header bytes with the checksum field counted as spaces.
uint32_t ComputeTarChecksum(const uint8_t* block);

bool IsZeroBlock(const uint8_t* block);

// Bytes of padding after a payload of the given size.
inline size_t TarPadding(uint64_t size) {
  return static_cast<size_t>((kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize);
}

}  // namespace clipshard::archive

#endif  // CLIPSHARD_ARCHIVE_TAR_HEADER_HPP_
