// Repository: RetroVue-clipshard
// Component: Thread-Safe Logger
// Purpose: Level-filtered log lines shared by all clip and shard workers.
// Copyright (c) 2026 RetroVue

#ifndef CLIPSHARD_UTIL_LOGGER_HPP_
#define CLIPSHARD_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace clipshard::util {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

const char* LogLevelName(LogLevel level);

// "debug", "info", "warn", "error" (case-sensitive); nullopt otherwise.
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Logger writes one whole line per call under a single static mutex, so lines
// from concurrent clip workers never interleave.
//
// Lines below the minimum level are dropped. The minimum starts at kInfo, or
// kDebug when CLIPSHARD_DEBUG is set in the environment, and can be changed
// with SetMinLevel (the tool's --log-level).
//
// kDebug/kInfo -> stdout, kWarn/kError -> stderr.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  static void SetMinLevel(LogLevel level);
  static LogLevel MinLevel();

  // Receives every emitted line (after level filtering) in addition to the
  // stream. Pass nullptr to clear.
  static void SetSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink sink_;
};

}  // namespace clipshard::util

#endif  // CLIPSHARD_UTIL_LOGGER_HPP_
