// Repository: RetroVue-clipshard
// Component: Shard Packer
// Purpose: Regroup chunk artifacts into fixed-capacity tar shards.
// Copyright (c) 2026 RetroVue

#include "clipshard/sharding/ShardPacker.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "clipshard/archive/TarWriter.hpp"
#include "clipshard/format/ChunkMetadata.hpp"
#include "clipshard/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipshard::sharding {

using chunking::ChunkError;
using chunking::ChunkStatus;
using chunking::OutputFormat;
using util::Logger;

namespace {

constexpr const char* kNpyExtension = ".npy";
constexpr const char* kChunkDirPrefix = "chunk_";
constexpr const char* kChunkMetadataFile = "metadata.json";

bool HasValidMetadata(const fs::path& chunk_dir) {
  std::ifstream in(chunk_dir / kChunkMetadataFile);
  if (!in) return false;
  const std::string json((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return format::ChunkMetadata::FromJson(json).has_value();
}

}  // namespace

std::string ShardName(int64_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "shard_%05lld.tar", static_cast<long long>(index));
  return buf;
}

ShardPacker::ShardPacker(OutputFormat format, int64_t shard_capacity)
    : format_(format), shard_capacity_(shard_capacity) {}

DiscoverResult ShardPacker::Discover(const std::string& input_root) const {
  DiscoverResult result{true, "", {}};
  std::error_code ec;
  fs::recursive_directory_iterator it(input_root, ec);
  if (ec) {
    return {false, "error walking " + input_root + ": " + ec.message(), {}};
  }

  const auto end = fs::recursive_directory_iterator();
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    const fs::directory_entry& entry = *it;
    std::error_code probe;
    const std::string name = entry.path().filename().string();

    if (format_ == OutputFormat::kNpy) {
      if (entry.is_regular_file(probe) && entry.path().extension() == kNpyExtension) {
        result.samples.push_back(entry.path().string());
      }
      continue;
    }

    if (!entry.is_directory(probe) || name.rfind(kChunkDirPrefix, 0) != 0) {
      continue;
    }
    if (!fs::is_regular_file(entry.path() / kChunkMetadataFile, probe)) {
      continue;
    }
    if (!HasValidMetadata(entry.path())) {
      Logger::Warn("[ShardPacker] SKIP_INVALID_METADATA dir=" + entry.path().string());
      continue;
    }
    result.samples.push_back(entry.path().string());
    // Chunk directories do not nest.
    it.disable_recursion_pending();
  }
  if (ec) {
    return {false, "error walking " + input_root + ": " + ec.message(), {}};
  }
  return result;
}

ChunkStatus ShardPacker::WriteShard(const std::string& shard_path,
                                    const std::vector<std::string>& samples,
                                    size_t begin, size_t end) const {
  archive::TarWriter writer;
  auto status = writer.Open(shard_path);
  if (!status.ok) return status;

  for (size_t i = begin; i < end; ++i) {
    const fs::path sample(samples[i]);
    if (format_ == OutputFormat::kNpy) {
      status = writer.AddFileFromDisk(sample.filename().string(), sample.string());
      if (!status.ok) return status;
      continue;
    }

    // Sorted so a chunk's frames land in the archive in frame order.
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(sample, ec), stop; !ec && it != stop;
         it.increment(ec)) {
      if (it->is_regular_file(ec)) files.push_back(it->path());
    }
    if (ec) {
      return ChunkStatus::Failure(ChunkError::kArchive,
                                  "error processing chunk directory " +
                                      sample.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    const fs::path parent = sample.parent_path();
    for (const auto& file : files) {
      const std::string tar_name = file.lexically_relative(parent).generic_string();
      status = writer.AddFileFromDisk(tar_name, file.string());
      if (!status.ok) return status;
    }
  }
  return writer.Finish();
}

PackResult ShardPacker::Pack(const std::string& input_root,
                             const std::string& output_root) const {
  if (shard_capacity_ <= 0) {
    return PackResult::Failure(ChunkError::kInvalidShardSize,
                               "invalid shard size: " + std::to_string(shard_capacity_));
  }

  DiscoverResult discovered = Discover(input_root);
  if (!discovered.ok) {
    return PackResult::Failure(ChunkError::kFilesystem, discovered.detail);
  }
  const auto& samples = discovered.samples;
  const int64_t sample_count = static_cast<int64_t>(samples.size());
  const int64_t shard_count = (sample_count + shard_capacity_ - 1) / shard_capacity_;

  for (int64_t i = 0; i < shard_count; ++i) {
    const size_t begin = static_cast<size_t>(i * shard_capacity_);
    const size_t end = static_cast<size_t>(std::min(sample_count, (i + 1) * shard_capacity_));
    const std::string shard_path = (fs::path(output_root) / ShardName(i)).string();

    auto status = WriteShard(shard_path, samples, begin, end);
    if (!status.ok) {
      std::error_code ec;
      fs::remove(shard_path, ec);
      std::ostringstream detail;
      detail << "error creating shard " << i << ": " << status.detail;
      Logger::Error("[ShardPacker] SHARD_FAILED index=" + std::to_string(i) +
                    " error=" + status.Describe());
      return PackResult::Failure(status.error, detail.str(), i);
    }
    Logger::Debug("[ShardPacker] SHARD_WRITTEN path=" + shard_path +
                  " samples=" + std::to_string(end - begin));
  }

  std::ostringstream oss;
  oss << "[ShardPacker] PACK_DONE samples=" << sample_count
      << " shards=" << shard_count << " capacity=" << shard_capacity_
      << " format=" << chunking::OutputFormatName(format_);
  Logger::Info(oss.str());
  return PackResult::Success(shard_count, sample_count);
}

PackResult PackShards(const std::string& output_dir, const std::string& shard_dir,
                      int64_t shard_size, const std::string& format) {
  auto output_format = chunking::ParseOutputFormat(format);
  if (!output_format) {
    return PackResult::Failure(ChunkError::kInvalidFormat,
                               "unsupported output format: " + format);
  }
  if (shard_size <= 0) {
    return PackResult::Failure(ChunkError::kInvalidShardSize,
                               "invalid shard size: " + std::to_string(shard_size));
  }
  std::error_code ec;
  fs::create_directories(shard_dir, ec);
  if (ec) {
    return PackResult::Failure(ChunkError::kFilesystem,
                               "error creating shard directory " + shard_dir + ": " +
                                   ec.message());
  }
  return ShardPacker(*output_format, shard_size).Pack(output_dir, shard_dir);
}

}  // namespace clipshard::sharding
