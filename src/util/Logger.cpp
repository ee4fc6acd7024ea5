// Repository: RetroVue-clipshard
// Component: Thread-Safe Logger
// Purpose: Level-filtered log lines shared by all clip and shard workers.
// Copyright (c) 2026 RetroVue

#include "clipshard/util/Logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace clipshard::util {

namespace {

LogLevel InitialLevel() {
  return std::getenv("CLIPSHARD_DEBUG") != nullptr ? LogLevel::kDebug : LogLevel::kInfo;
}

// Read on every call without the mutex; only the write path locks.
std::atomic<LogLevel>& MinLevelRef() {
  static std::atomic<LogLevel> level{InitialLevel()};
  return level;
}

}  // namespace

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
  for (LogLevel level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn,
                         LogLevel::kError}) {
    if (name == LogLevelName(level)) return level;
  }
  return std::nullopt;
}

void Logger::SetMinLevel(LogLevel level) {
  MinLevelRef().store(level, std::memory_order_relaxed);
}

LogLevel Logger::MinLevel() {
  return MinLevelRef().load(std::memory_order_relaxed);
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level < MinLevel()) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace clipshard::util
