// Repository: RetroVue-clipshard
// Component: Run Configuration
// Purpose: Every tunable of a clipshard run, from flags and a JSON file.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_RUNTIME_RUN_CONFIG_HPP_
#define CLIPSHARD_RUNTIME_RUN_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "clipshard/chunking/ChunkTypes.hpp"

namespace clipshard::runtime {

struct RunConfig {
  std::string tar_path;        // empty: skip clip processing
  std::string output_dir = "output";
  int fps = 8;
  std::string size = "256x256";
  std::string format = "jpg";
  int64_t frames = 16;
  bool pad = false;            // PadPolicy::kPad instead of kTruncate
  int workers = DefaultWorkerCount();
  int64_t shard_size = 1000;
  std::string shard_dir;       // empty: no sharding
  std::string tmp_dir;         // empty: system temp directory
  std::string log_level;       // empty: keep the logger's default
  std::string config_path;
  bool help = false;

  chunking::PadPolicy Policy() const {
    return pad ? chunking::PadPolicy::kPad : chunking::PadPolicy::kTruncate;
  }

  // All input checks, run before any clip is touched.
  chunking::ChunkStatus Validate() const;

  // hardware_concurrency, or 4 when unknown.
  static int DefaultWorkerCount();
};

// Overlays keys present in json onto config. Unknown keys are ignored;
// a known key with a value of the wrong type is an error.
bool ApplyJsonConfig(const std::string& json, RunConfig& config, std::string& error);

struct CliParseResult {
  bool ok;
  std::string error;
  RunConfig config;
};

// Defaults, then --config file (if given), then the remaining flags.
CliParseResult ParseCommandLine(int argc, const char* const argv[]);

}  // namespace clipshard::runtime

#endif  // CLIPSHARD_RUNTIME_RUN_CONFIG_HPP_
