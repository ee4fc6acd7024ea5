// Repository: RetroVue-clipshard
// Component: Shard Packer
// Purpose: Regroup chunk artifacts into fixed-capacity tar shards.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_SHARDING_SHARD_PACKER_HPP_
#define CLIPSHARD_SHARDING_SHARD_PACKER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::sharding {

constexpr int64_t kDefaultShardSize = 1000;

struct PackResult {
  bool ok;
  chunking::ChunkError error;
  std::string detail;
  int64_t shards_written;
  int64_t samples;

  static PackResult Success(int64_t shards, int64_t samples) {
    return {true, chunking::ChunkError::kNone, "", shards, samples};
  }

  static PackResult Failure(chunking::ChunkError err, const std::string& detail,
                            int64_t shards_written = 0) {
    return {false, err, detail, shards_written, 0};
  }
};

struct DiscoverResult {
  bool ok;
  std::string detail;
  std::vector<std::string> samples;
};

// Single-threaded; the input tree must not change while Pack() runs.
//
// Samples are .npy files (kNpy) or chunk_* directories holding a parseable
// metadata.json (kJpeg), taken in filesystem traversal order. Shard i holds
// samples [i*capacity, (i+1)*capacity) and is written to
// <output_root>/shard_NNNNN.tar. npy samples are stored under their base
// name; chunk directories as <chunk_dir_name>/<relative path>.
//
// A failing shard stops packing; its partial file is removed, earlier shards
// stay.
class ShardPacker {
 public:
  ShardPacker(chunking::OutputFormat format, int64_t shard_capacity);

  DiscoverResult Discover(const std::string& input_root) const;

  PackResult Pack(const std::string& input_root, const std::string& output_root) const;

 private:
  chunking::ChunkStatus WriteShard(const std::string& shard_path,
                                   const std::vector<std::string>& samples,
                                   size_t begin, size_t end) const;

  chunking::OutputFormat format_;
  int64_t shard_capacity_;
};

// "shard_00007.tar"
std::string ShardName(int64_t index);

// Shard entry point: validates shard_size and format, creates shard_dir.
PackResult PackShards(const std::string& output_dir, const std::string& shard_dir,
                      int64_t shard_size, const std::string& format);

}  // namespace clipshard::sharding

#endif  // CLIPSHARD_SHARDING_SHARD_PACKER_HPP_
