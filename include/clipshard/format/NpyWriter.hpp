// Repository: RetroVue-clipshard
// Component: NPY Array Writer
// Purpose: Dense uint8 tensor files in the NumPy .npy v1.0 layout.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_FORMAT_NPY_WRITER_HPP_
#define CLIPSHARD_FORMAT_NPY_WRITER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::format {

// .npy v1.0 layout:
//
//   \x93NUMPY \x01 \x00            8 bytes magic + version
//   uint16 little-endian          length of dictionary + padding
//   {'descr': '<u1', 'fortran_order': False, 'shape': (d0, d1, ...)}
//   ' ' * padding                 so that 10 + len(dict) + padding % 16 == 0
//   payload                       row-major bytes
//
// The dictionary text is byte-exact with what array readers expect; do not
// change spacing or punctuation.
inline constexpr char kNpyMagic[] = "\x93NUMPY";
inline constexpr size_t kNpyMagicLen = 6;
inline constexpr size_t kNpyPreambleLen = 10;  // magic + version + uint16 len
inline constexpr size_t kNpyAlignment = 16;

// Dictionary literal for a uint8 C-order array of the given shape.
std::string BuildNpyDictionary(const std::vector<int64_t>& shape);

// Full header (preamble + dictionary + padding). Returns nullopt when the
// dictionary does not fit the v1.0 uint16 length field.
std::optional<std::string> BuildNpyHeader(const std::vector<int64_t>& shape);

// Creates path and writes header + payload in one pass. The payload length is
// not checked against the shape; callers guarantee it.
chunking::ChunkStatus WriteNpyFile(const std::string& path,
                                   const uint8_t* data, size_t size,
                                   const std::vector<int64_t>& shape);

// Parsed .npy header (reader side, for verification).
struct NpyHeader {
  std::string descr;
  bool fortran_order = false;
  std::vector<int64_t> shape;
  size_t data_offset = 0;  // payload starts here

  int64_t ElementCount() const;
};

// Parses the header at the start of bytes. Returns nullopt on a bad magic,
// truncated preamble, or a dictionary that cannot be read.
std::optional<NpyHeader> ReadNpyHeader(const uint8_t* bytes, size_t size);

}  // namespace clipshard::format

#endif  // CLIPSHARD_FORMAT_NPY_WRITER_HPP_
