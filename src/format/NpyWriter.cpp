// Repository: RetroVue-clipshard
// Component: NPY Array Writer
// Purpose: Dense uint8 tensor files in the NumPy .npy v1.0 layout.
// Copyright (c) 2026 RetroVue

#include "clipshard/format/NpyWriter.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace clipshard::format {

using chunking::ChunkError;
using chunking::ChunkStatus;

std::string BuildNpyDictionary(const std::vector<int64_t>& shape) {
  std::ostringstream dict;
  dict << "{'descr': '<u1', 'fortran_order': False, 'shape': (";
  for (size_t i = 0; i < shape.size(); ++i) {
    dict << shape[i];
    if (i + 1 < shape.size()) {
      dict << ", ";
    }
  }
  // A one-element tuple needs its trailing comma to stay a tuple.
  if (shape.size() == 1) {
    dict << ",";
  }
  dict << ")}";
  return dict.str();
}

std::optional<std::string> BuildNpyHeader(const std::vector<int64_t>& shape) {
  const std::string dict = BuildNpyDictionary(shape);
  const size_t unpadded = kNpyPreambleLen + dict.size();
  const size_t padding = (kNpyAlignment - (unpadded % kNpyAlignment)) % kNpyAlignment;
  const size_t header_len = dict.size() + padding;
  if (header_len > 0xFFFF) {
    return std::nullopt;
  }

  std::string header;
  header.reserve(kNpyPreambleLen + header_len);
  header.append(kNpyMagic, kNpyMagicLen);
  header.push_back('\x01');  // major version
  header.push_back('\x00');  // minor version
  header.push_back(static_cast<char>(header_len & 0xFF));
  header.push_back(static_cast<char>((header_len >> 8) & 0xFF));
  header.append(dict);
  header.append(padding, ' ');
  return header;
}

ChunkStatus WriteNpyFile(const std::string& path,
                         const uint8_t* data, size_t size,
                         const std::vector<int64_t>& shape) {
  auto header = BuildNpyHeader(shape);
  if (!header) {
    return ChunkStatus::Failure(ChunkError::kShapeMismatch,
                                "npy header too long for shape rank " +
                                    std::to_string(shape.size()));
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error creating npy file " + path + ": " +
                                    std::strerror(errno));
  }
  out.write(header->data(), static_cast<std::streamsize>(header->size()));
  if (size > 0) {
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  }
  out.close();
  if (!out) {
    return ChunkStatus::Failure(ChunkError::kFilesystem,
                                "error writing npy file " + path);
  }
  return ChunkStatus::Success();
}

int64_t NpyHeader::ElementCount() const {
  int64_t count = 1;
  for (int64_t dim : shape) {
    count *= dim;
  }
  return count;
}

namespace {

// Value text following 'key': up to the next top-level ',' or '}'.
bool FindDictValue(const std::string& dict, const std::string& key,
                   size_t& value_pos) {
  const std::string search = "'" + key + "':";
  size_t pos = dict.find(search);
  if (pos == std::string::npos) return false;
  pos += search.size();
  while (pos < dict.size() && dict[pos] == ' ') ++pos;
  value_pos = pos;
  return pos < dict.size();
}

}  // namespace

std::optional<NpyHeader> ReadNpyHeader(const uint8_t* bytes, size_t size) {
  if (size < kNpyPreambleLen ||
      std::memcmp(bytes, kNpyMagic, kNpyMagicLen) != 0 ||
      bytes[6] != 0x01) {
    return std::nullopt;
  }
  const size_t header_len = static_cast<size_t>(bytes[8]) |
                            (static_cast<size_t>(bytes[9]) << 8);
  if (kNpyPreambleLen + header_len > size) {
    return std::nullopt;
  }
  const std::string dict(reinterpret_cast<const char*>(bytes) + kNpyPreambleLen,
                         header_len);

  NpyHeader header;
  header.data_offset = kNpyPreambleLen + header_len;

  size_t pos = 0;
  if (!FindDictValue(dict, "descr", pos) || dict[pos] != '\'') {
    return std::nullopt;
  }
  const size_t descr_end = dict.find('\'', pos + 1);
  if (descr_end == std::string::npos) return std::nullopt;
  header.descr = dict.substr(pos + 1, descr_end - pos - 1);

  if (!FindDictValue(dict, "fortran_order", pos)) return std::nullopt;
  if (dict.compare(pos, 4, "True") == 0) {
    header.fortran_order = true;
  } else if (dict.compare(pos, 5, "False") == 0) {
    header.fortran_order = false;
  } else {
    return std::nullopt;
  }

  if (!FindDictValue(dict, "shape", pos) || dict[pos] != '(') {
    return std::nullopt;
  }
  const size_t shape_end = dict.find(')', pos);
  if (shape_end == std::string::npos) return std::nullopt;

  std::string token;
  for (size_t i = pos + 1; i <= shape_end; ++i) {
    const char c = dict[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      token += c;
    } else if (c == ',' || c == ')') {
      if (!token.empty()) {
        if (token.size() > 18) return std::nullopt;
        header.shape.push_back(std::stoll(token));
        token.clear();
      }
    } else if (c != ' ') {
      return std::nullopt;
    }
  }
  return header;
}

}  // namespace clipshard::format
