// Repository: RetroVue-clipshard
// Component: clipshard Command-Line Tool
// Purpose: Tar of clips in, fixed-length frame chunks and tar shards out.
// Copyright (c) 2026 RetroVue
//
// STEPS:
// 1. Parse and validate configuration (exit 2 on any invalid setting)
// 2. Extract video clips from --tar (skipped when absent or missing)
// 3. Decode, chunk and serialize every clip in parallel
// 4. Pack the output tree into shard_NNNNN.tar files when --shard-dir is set

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "clipshard/archive/TarReader.hpp"
#include "clipshard/decode/FFmpegDecodeEngine.hpp"
#include "clipshard/pipeline/ParallelOrchestrator.hpp"
#include "clipshard/runtime/RunConfig.hpp"
#include "clipshard/sharding/ShardPacker.hpp"
#include "clipshard/util/Logger.hpp"

namespace {

using clipshard::runtime::RunConfig;
using clipshard::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Split a tar archive of video clips into fixed-length frame chunks\n"
            << "and optionally pack the chunks into tar shards.\n"
            << "\n"
            << "INPUT / OUTPUT:\n"
            << "  --tar PATH           Input .tar archive of clips\n"
            << "  --out DIR            Output directory (default: output)\n"
            << "  --config PATH        JSON config file; flags override its values\n"
            << "  --tmp-dir DIR        Directory for temporary clip files\n"
            << "\n"
            << "CHUNKING:\n"
            << "  --fps N              Target frames per second (default: 8)\n"
            << "  --size WxH           Output frame size (default: 256x256)\n"
            << "  --format jpg|npy     Output format (default: jpg)\n"
            << "  --frames N           Frames per chunk (default: 16)\n"
            << "  --pad                Pad the last short chunk instead of dropping it\n"
            << "  --workers N          Parallel workers (default: number of CPU cores)\n"
            << "\n"
            << "SHARDING:\n"
            << "  --shard-dir DIR      Write shard_NNNNN.tar files here\n"
            << "  --shard-size N       Chunks per shard (default: 1000)\n"
            << "\n"
            << "  --log-level LEVEL    debug, info, warn or error (default: info)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --tar clips.tar --out frames --format npy\n"
            << "  " << program_name << " --out frames --format npy --shard-dir shards\n"
            << "\n";
}

int ProcessClips(const RunConfig& config) {
  if (config.tar_path.empty()) {
    Logger::Info("Skipping clip processing as no input file specified");
    return kExitOk;
  }
  std::error_code ec;
  if (!std::filesystem::exists(config.tar_path, ec)) {
    Logger::Info("Skipping clip processing as input file " + config.tar_path +
                 " does not exist");
    return kExitOk;
  }

  auto extracted = clipshard::archive::TarReader::ExtractClips(config.tar_path);
  if (!extracted.ok) {
    std::cerr << "Error extracting tar: " << extracted.detail << "\n";
    return kExitFailure;
  }

  const int workers = config.workers > 0 ? config.workers : RunConfig::DefaultWorkerCount();
  Logger::Info("Processing " + std::to_string(extracted.clips.size()) +
               " clips using " + std::to_string(workers) + " workers...");

  clipshard::decode::FFmpegDecodeEngine engine;
  auto status = clipshard::pipeline::ProcessAll(
      engine, extracted.clips, config.output_dir, config.fps, config.size,
      config.format, config.frames, workers, config.Policy(), config.tmp_dir);
  if (!status.ok) {
    std::cerr << "Error processing clips: " << status.detail << "\n";
    return kExitFailure;
  }
  Logger::Info("Processed clips successfully");
  return kExitOk;
}

int PackShards(const RunConfig& config) {
  auto packed = clipshard::sharding::PackShards(config.output_dir, config.shard_dir,
                                                config.shard_size, config.format);
  if (!packed.ok) {
    std::cerr << "Error creating shards: " << packed.detail << "\n";
    return kExitFailure;
  }
  Logger::Info("Created " + std::to_string(packed.shards_written) + " shards from " +
               std::to_string(packed.samples) + " chunks in " + config.shard_dir);
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto parsed = clipshard::runtime::ParseCommandLine(argc, argv);
  if (!parsed.ok) {
    std::cerr << "Error: " << parsed.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }
  const RunConfig& config = parsed.config;
  if (config.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  auto validation = config.Validate();
  if (!validation.ok) {
    std::cerr << "Error: " << validation.detail << "\n";
    return kExitUsage;
  }
  if (!config.log_level.empty()) {
    Logger::SetMinLevel(*clipshard::util::ParseLogLevel(config.log_level));
  }

  int rc = ProcessClips(config);
  if (rc != kExitOk) return rc;

  if (!config.shard_dir.empty()) {
    rc = PackShards(config);
  }
  return rc;
}
