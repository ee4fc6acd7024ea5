// Scratch directory under /tmp, removed when the fixture goes out of scope.

#ifndef CLIPSHARD_TESTS_FIXTURES_TEMP_DIR_H_
#define CLIPSHARD_TESTS_FIXTURES_TEMP_DIR_H_

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace clipshard::tests::fixtures {

class TempDir {
 public:
  explicit TempDir(const std::string& suite) {
    static std::atomic<int> counter{0};
    path_ = "/tmp/clipshard_" + suite + "_" + std::to_string(getpid()) + "_" +
            std::to_string(counter.fetch_add(1));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  std::string Join(const std::string& relative) const { return path_ + "/" + relative; }

 private:
  std::string path_;
};

inline std::vector<uint8_t> ReadFileBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
}

inline std::string ReadFileText(const std::string& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

inline void WriteFileText(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary);
  out << text;
}

}  // namespace clipshard::tests::fixtures

#endif  // CLIPSHARD_TESTS_FIXTURES_TEMP_DIR_H_
