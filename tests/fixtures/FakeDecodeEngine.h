// Fake decode engine for pipeline and orchestrator tests.
// Synthesizes deterministic frames without any real video; can be told to
// fail or throw for chosen clip keys.

#ifndef CLIPSHARD_TESTS_FIXTURES_FAKE_DECODE_ENGINE_H_
#define CLIPSHARD_TESTS_FIXTURES_FAKE_DECODE_ENGINE_H_

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <new>
#include <set>
#include <string>
#include <vector>

#include "clipshard/decode/IDecodeEngine.hpp"

namespace clipshard::tests::fixtures {

class FakeDecodeEngine : public decode::IDecodeEngine {
 public:
  explicit FakeDecodeEngine(int64_t frames_per_clip, int source_fps = 30)
      : frames_per_clip_(frames_per_clip), source_fps_(source_fps) {}

  void SetFrameCount(const std::string& key, int64_t frames) {
    std::lock_guard<std::mutex> lock(mutex_);
    frame_counts_[key] = frames;
  }

  void FailKey(const std::string& key, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[key] = message;
  }

  // Decoding this key throws std::bad_alloc, as an oversized clip would.
  void ThrowOnKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwing_.insert(key);
  }

  // Raw buffers come back one byte short of a whole frame for this key.
  void CorruptKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    corrupt_.insert(key);
  }

  static constexpr const char* kZeroFrameText = "fake-jpeg zero";

  // Frame i (0-based) is filled with byte value (i + 1) % 256.
  static uint8_t FrameFill(int64_t i) { return static_cast<uint8_t>((i + 1) % 256); }

  // Pipeline temp inputs are named <pid>_<key>.<ext>.
  static std::string KeyFromInputPath(const std::string& path) {
    const std::string stem = std::filesystem::path(path).stem().string();
    const size_t underscore = stem.find('_');
    return underscore == std::string::npos ? stem : stem.substr(underscore + 1);
  }

  decode::DecodeResult DecodeRaw(const decode::DecodeRequest& request) override {
    std::string key;
    int64_t frames = 0;
    std::string failure;
    if (!Begin(request, key, frames, failure)) {
      return decode::DecodeResult::Failure(failure);
    }

    const int64_t frame_bytes = request.dims.FrameBytes();
    chunking::FrameStream stream;
    stream.raw.resize(static_cast<size_t>(frames * frame_bytes));
    for (int64_t i = 0; i < frames; ++i) {
      std::fill(stream.raw.begin() + i * frame_bytes,
                stream.raw.begin() + (i + 1) * frame_bytes, FrameFill(i));
    }
    if (IsCorrupt(key) && !stream.raw.empty()) {
      stream.raw.pop_back();
    }
    return decode::DecodeResult::Success(std::move(stream), source_fps_);
  }

  decode::DecodeResult DecodeToImages(const decode::DecodeRequest& request,
                                      const std::string& output_dir) override {
    std::string key;
    int64_t frames = 0;
    std::string failure;
    if (!Begin(request, key, frames, failure)) {
      return decode::DecodeResult::Failure(failure);
    }

    chunking::FrameStream stream;
    // Written in reverse so the serializer has to sort.
    for (int64_t i = frames; i >= 1; --i) {
      char name[32];
      std::snprintf(name, sizeof(name), "frame_%06lld.jpg", static_cast<long long>(i));
      const std::string path = output_dir + "/" + name;
      std::ofstream out(path, std::ios::binary);
      out << "fake-jpeg " << key << " " << i;
      stream.frame_files.push_back(path);
    }
    stream.zero_frame_file = output_dir + "/zero_frame.jpg";
    std::ofstream zero(stream.zero_frame_file, std::ios::binary);
    zero << kZeroFrameText;
    return decode::DecodeResult::Success(std::move(stream), source_fps_);
  }

  int decode_calls() const { return decode_calls_.load(); }

  std::vector<std::string> seen_inputs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_inputs_;
  }

 private:
  bool Begin(const decode::DecodeRequest& request, std::string& key, int64_t& frames,
             std::string& failure) {
    decode_calls_.fetch_add(1);

    key = KeyFromInputPath(request.input_path);
    bool input_exists = std::filesystem::exists(request.input_path);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      seen_inputs_.push_back(request.input_path);
      auto fail = failures_.find(key);
      if (fail != failures_.end()) {
        failure = fail->second;
      }
      auto count = frame_counts_.find(key);
      frames = count != frame_counts_.end() ? count->second : frames_per_clip_;
    }

    if (!input_exists) {
      failure = "input not found: " + request.input_path;
    }
    if (Throws(key)) {
      throw std::bad_alloc();
    }
    return failure.empty();
  }

  bool Throws(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throwing_.count(key) > 0;
  }

  bool IsCorrupt(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return corrupt_.count(key) > 0;
  }

  int64_t frames_per_clip_;
  int source_fps_;

  mutable std::mutex mutex_;
  std::map<std::string, int64_t> frame_counts_;
  std::map<std::string, std::string> failures_;
  std::set<std::string> corrupt_;
  std::set<std::string> throwing_;
  std::vector<std::string> seen_inputs_;

  std::atomic<int> decode_calls_{0};
};

}  // namespace clipshard::tests::fixtures

#endif  // CLIPSHARD_TESTS_FIXTURES_FAKE_DECODE_ENGINE_H_
