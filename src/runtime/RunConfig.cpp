// Repository: RetroVue-clipshard
// Component: Run Configuration
// Purpose: Every tunable of a clipshard run, from flags and a JSON file.
// Copyright (c) 2026 RetroVue

#include "clipshard/runtime/RunConfig.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <regex>
#include <thread>

#include "clipshard/util/JsonFields.hpp"
#include "clipshard/util/Logger.hpp"

namespace clipshard::runtime {

using chunking::ChunkError;
using chunking::ChunkStatus;

namespace {

bool ParseInt64(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  out = value;
  return true;
}

bool ParseInt(const std::string& text, int& out) {
  int64_t value = 0;
  if (!ParseInt64(text, value) || value < INT_MIN || value > INT_MAX) return false;
  out = static_cast<int>(value);
  return true;
}

// A field that is present but did not parse as the expected type.
bool PresentButMalformed(const std::string& json, const std::string& field) {
  std::regex pattern("\"" + field + "\"\\s*:");
  return std::regex_search(json, pattern);
}

bool ApplyInt(const std::string& json, const char* field, int64_t& target,
              std::string& error) {
  int64_t value = 0;
  if (util::ExtractInt(json, field, value)) {
    target = value;
    return true;
  }
  if (PresentButMalformed(json, field)) {
    error = std::string("config field '") + field + "' must be an integer";
    return false;
  }
  return true;
}

bool ApplyString(const std::string& json, const char* field, std::string& target,
                 std::string& error) {
  std::string value;
  if (util::ExtractString(json, field, value)) {
    target = value;
    return true;
  }
  if (PresentButMalformed(json, field)) {
    error = std::string("config field '") + field + "' must be a string";
    return false;
  }
  return true;
}

}  // namespace

int RunConfig::DefaultWorkerCount() {
  const unsigned int n = std::thread::hardware_concurrency();
  return n == 0 ? 4 : static_cast<int>(n);
}

ChunkStatus RunConfig::Validate() const {
  if (fps <= 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidFps,
                                "invalid fps: " + std::to_string(fps));
  }
  auto dims = chunking::ParseDimensions(size);
  if (!dims.valid) {
    return ChunkStatus::Failure(dims.error, dims.detail);
  }
  if (!chunking::ParseOutputFormat(format)) {
    return ChunkStatus::Failure(ChunkError::kInvalidFormat,
                                "unsupported format " + format +
                                    ". Supported formats are: jpg, npy");
  }
  if (frames <= 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidChunkLength,
                                "invalid chunk length: " + std::to_string(frames));
  }
  if (format == "jpg" && frames > chunking::kMaxImageChunkFrames) {
    return ChunkStatus::Failure(
        ChunkError::kInvalidChunkLength,
        "invalid chunk length: " + std::to_string(frames) + " (jpg chunks hold at most " +
            std::to_string(chunking::kMaxImageChunkFrames) + " frames)");
  }
  if (workers < 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidWorkerCount,
                                "invalid worker count: " + std::to_string(workers));
  }
  if (!shard_dir.empty() && shard_size <= 0) {
    return ChunkStatus::Failure(ChunkError::kInvalidShardSize,
                                "invalid shard size: " + std::to_string(shard_size));
  }
  if (!log_level.empty() && !util::ParseLogLevel(log_level)) {
    return ChunkStatus::Failure(ChunkError::kInvalidLogLevel,
                                "invalid log level " + log_level +
                                    ". Supported levels are: debug, info, warn, error");
  }
  return ChunkStatus::Success();
}

bool ApplyJsonConfig(const std::string& json, RunConfig& config, std::string& error) {
  int64_t fps = config.fps;
  int64_t workers = config.workers;

  if (!ApplyString(json, "tar", config.tar_path, error)) return false;
  if (!ApplyString(json, "output_dir", config.output_dir, error)) return false;
  if (!ApplyInt(json, "fps", fps, error)) return false;
  if (!ApplyString(json, "size", config.size, error)) return false;
  if (!ApplyString(json, "format", config.format, error)) return false;
  if (!ApplyInt(json, "frames", config.frames, error)) return false;
  if (!ApplyInt(json, "workers", workers, error)) return false;
  if (!ApplyInt(json, "shard_size", config.shard_size, error)) return false;
  if (!ApplyString(json, "shard_dir", config.shard_dir, error)) return false;
  if (!ApplyString(json, "tmp_dir", config.tmp_dir, error)) return false;
  if (!ApplyString(json, "log_level", config.log_level, error)) return false;

  bool pad = config.pad;
  if (util::ExtractBool(json, "pad", pad)) {
    config.pad = pad;
  } else if (PresentButMalformed(json, "pad")) {
    error = "config field 'pad' must be true or false";
    return false;
  }

  if (fps < INT_MIN || fps > INT_MAX || workers < INT_MIN || workers > INT_MAX) {
    error = "config field out of range";
    return false;
  }
  config.fps = static_cast<int>(fps);
  config.workers = static_cast<int>(workers);
  return true;
}

CliParseResult ParseCommandLine(int argc, const char* const argv[]) {
  CliParseResult result{false, "", RunConfig()};
  RunConfig& config = result.config;

  // The config file is the base layer; find it before applying any flag.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      config.config_path = argv[i + 1];
    }
  }
  if (!config.config_path.empty()) {
    std::ifstream in(config.config_path);
    if (!in) {
      result.error = "cannot read config file " + config.config_path + ": " +
                     std::strerror(errno);
      return result;
    }
    const std::string json((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    std::string error;
    if (!ApplyJsonConfig(json, config, error)) {
      result.error = config.config_path + ": " + error;
      return result;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    auto bad_value = [&](const std::string& flag) {
      result.error = "invalid value for " + flag + ": " + argv[i];
      return result;
    };

    if (arg == "--help" || arg == "-h") {
      config.help = true;
      result.ok = true;
      return result;
    } else if (arg == "--pad") {
      config.pad = true;
    } else if (!has_value) {
      result.error = "Unknown argument or missing value: " + arg;
      return result;
    } else if (arg == "--config") {
      ++i;
    } else if (arg == "--tar") {
      config.tar_path = argv[++i];
    } else if (arg == "--out") {
      config.output_dir = argv[++i];
    } else if (arg == "--fps") {
      if (!ParseInt(argv[++i], config.fps)) return bad_value(arg);
    } else if (arg == "--size") {
      config.size = argv[++i];
    } else if (arg == "--format") {
      config.format = argv[++i];
    } else if (arg == "--frames") {
      if (!ParseInt64(argv[++i], config.frames)) return bad_value(arg);
    } else if (arg == "--workers") {
      if (!ParseInt(argv[++i], config.workers)) return bad_value(arg);
    } else if (arg == "--shard-size") {
      if (!ParseInt64(argv[++i], config.shard_size)) return bad_value(arg);
    } else if (arg == "--shard-dir") {
      config.shard_dir = argv[++i];
    } else if (arg == "--tmp-dir") {
      config.tmp_dir = argv[++i];
    } else if (arg == "--log-level") {
      config.log_level = argv[++i];
    } else {
      result.error = "Unknown argument: " + arg;
      return result;
    }
  }

  result.ok = true;
  return result;
}

}  // namespace clipshard::runtime
