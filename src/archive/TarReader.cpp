// Repository: RetroVue-clipshard
// Component: Tar Reader
// Purpose: Sequential ustar/GNU tar reader and video clip extraction.
// Copyright (c) 2026 RetroVue

#include "clipshard/archive/TarReader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <unordered_set>

#include "TarHeader.hpp"
#include "clipshard/util/Logger.hpp"

namespace clipshard::archive {

using util::Logger;

namespace {

// Entries larger than this are treated as corruption rather than allocated.
constexpr int64_t kMaxEntryBytes = int64_t{1} << 34;  // 16 GiB

std::string BaseName(const std::string& path) {
  std::string trimmed = path;
  while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
  const size_t slash = trimmed.rfind('/');
  return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// pax records: "<len> <key>=<value>\n" repeated.
std::string PaxPath(const std::vector<uint8_t>& data) {
  const std::string text(data.begin(), data.end());
  std::string path;
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t space = text.find(' ', pos);
    if (space == std::string::npos) break;
    size_t len = 0;
    for (size_t i = pos; i < space; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(text[i]))) return path;
      len = len * 10 + static_cast<size_t>(text[i] - '0');
      if (len > text.size()) return path;
    }
    if (len == 0 || pos + len > text.size()) break;
    const std::string record = text.substr(space + 1, pos + len - space - 2);
    if (record.compare(0, 5, "path=") == 0) {
      path = record.substr(5);
    }
    pos += len;
  }
  return path;
}

}  // namespace

bool IsVideoFileName(const std::string& name) {
  static const char* const kExtensions[] = {".mp4", ".mov", ".mkv", ".webm", ".avi"};
  const std::string lower = ToLower(name);
  for (const char* ext : kExtensions) {
    const size_t n = std::strlen(ext);
    if (lower.size() > n && lower.compare(lower.size() - n, n, ext) == 0) {
      return true;
    }
  }
  return false;
}

bool TarReader::Open(const std::string& path) {
  path_ = path;
  entries_read_ = 0;
  in_.open(path, std::ios::binary);
  if (!in_) {
    last_error_ = "error opening " + path + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

TarReader::NextStatus TarReader::Fail(const std::string& error) {
  last_error_ = path_ + ": " + error;
  return NextStatus::kError;
}

bool TarReader::ReadBlock(uint8_t* block) {
  in_.read(reinterpret_cast<char*>(block), kTarBlockSize);
  return in_.gcount() == static_cast<std::streamsize>(kTarBlockSize);
}

bool TarReader::ReadPayload(int64_t size, std::vector<uint8_t>& out) {
  out.resize(static_cast<size_t>(size));
  if (size > 0) {
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    if (in_.gcount() != static_cast<std::streamsize>(size)) return false;
  }
  return SkipPayload(static_cast<int64_t>(TarPadding(static_cast<uint64_t>(size))));
}

bool TarReader::SkipPayload(int64_t size) {
  if (size == 0) return true;
  in_.seekg(size, std::ios::cur);
  return static_cast<bool>(in_);
}

TarReader::NextStatus TarReader::Next(TarEntry& entry) {
  if (!in_.is_open()) {
    return Fail("archive not open");
  }

  std::string pending_name;
  uint8_t block[kTarBlockSize];

  for (;;) {
    if (!ReadBlock(block)) {
      // A clean end of file without terminator blocks is tolerated.
      if (in_.gcount() == 0 && pending_name.empty()) return NextStatus::kEnd;
      return Fail("truncated header block after " + std::to_string(entries_read_) +
                  " entries");
    }
    if (IsZeroBlock(block)) {
      return NextStatus::kEnd;
    }

    auto stored = ReadTarNumber(block, kTarChecksum);
    if (!stored || static_cast<uint32_t>(*stored) != ComputeTarChecksum(block)) {
      return Fail("bad header checksum after " + std::to_string(entries_read_) +
                  " entries");
    }
    auto size = ReadTarNumber(block, kTarSize);
    if (!size || *size < 0 || *size > kMaxEntryBytes) {
      return Fail("bad entry size after " + std::to_string(entries_read_) + " entries");
    }

    const char type = static_cast<char>(block[kTarTypeflag.offset]);
    if (type == kTarTypeGnuLongName || type == kTarTypePaxHeader) {
      std::vector<uint8_t> data;
      if (!ReadPayload(*size, data)) {
        return Fail("truncated extended header");
      }
      if (type == kTarTypeGnuLongName) {
        pending_name = ReadTarString(data.data(), TarField{0, data.size()});
      } else {
        std::string path = PaxPath(data);
        if (!path.empty()) pending_name = path;
      }
      continue;
    }

    entry.type = type;
    entry.data.clear();
    if (!pending_name.empty()) {
      entry.name = pending_name;
    } else {
      const std::string name = ReadTarString(block, kTarName);
      const std::string magic = ReadTarString(block, kTarMagic);
      const std::string prefix =
          magic.compare(0, 5, "ustar") == 0 ? ReadTarString(block, kTarPrefix) : "";
      entry.name = prefix.empty() ? name : prefix + "/" + name;
    }

    if (entry.IsRegularFile()) {
      if (!ReadPayload(*size, entry.data)) {
        return Fail("truncated data for " + entry.name);
      }
    } else if (!SkipPayload(*size + static_cast<int64_t>(TarPadding(*size)))) {
      return Fail("truncated data for " + entry.name);
    }
    ++entries_read_;
    return NextStatus::kEntry;
  }
}

ExtractResult TarReader::ExtractClips(const std::string& path) {
  TarReader reader;
  if (!reader.Open(path)) {
    return ExtractResult::Failure(reader.LastError());
  }

  std::vector<chunking::Clip> clips;
  std::unordered_set<std::string> seen;
  TarEntry entry;
  for (;;) {
    const NextStatus status = reader.Next(entry);
    if (status == NextStatus::kEnd) break;
    if (status == NextStatus::kError) {
      return ExtractResult::Failure(reader.LastError());
    }
    if (!entry.IsRegularFile()) continue;

    const std::string base = BaseName(entry.name);
    if (base.empty() || base[0] == '.' || !IsVideoFileName(base)) {
      Logger::Debug("[TarReader] SKIP name=" + entry.name);
      continue;
    }

    std::string key = base.substr(0, base.rfind('.'));
    if (!seen.insert(key).second) {
      Logger::Warn("[TarReader] DUPLICATE_KEY key=" + key + " name=" + entry.name +
                   " (keeping first)");
      continue;
    }
    clips.push_back(chunking::Clip{std::move(key), std::move(entry.data)});
    entry.data = {};
  }

  Logger::Info("[TarReader] EXTRACTED path=" + path +
               " clips=" + std::to_string(clips.size()));
  return ExtractResult::Success(std::move(clips));
}

}  // namespace clipshard::archive
