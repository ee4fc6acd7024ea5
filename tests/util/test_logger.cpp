// Repository: RetroVue-clipshard
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "clipshard/util/Logger.hpp"

namespace clipshard::util {
namespace {

// Restores the process-wide logger state after each test.
class LoggerTest : public ::testing::Test {
 protected:
  LoggerTest() : saved_level_(Logger::MinLevel()) {
    Logger::SetSink([this](LogLevel level, const std::string& line) {
      captured_.emplace_back(level, line);
    });
  }

  ~LoggerTest() override {
    Logger::SetSink(nullptr);
    Logger::SetMinLevel(saved_level_);
  }

  LogLevel saved_level_;
  std::vector<std::pair<LogLevel, std::string>> captured_;
};

TEST_F(LoggerTest, DropsLinesBelowMinimumLevel) {
  Logger::SetMinLevel(LogLevel::kWarn);
  Logger::Debug("[Test] DEBUG_LINE");
  Logger::Info("[Test] INFO_LINE");
  Logger::Warn("[Test] WARN_LINE");
  Logger::Error("[Test] ERROR_LINE");

  ASSERT_EQ(captured_.size(), 2u);
  EXPECT_TRUE(captured_[0].first == LogLevel::kWarn);
  EXPECT_EQ(captured_[0].second, "[Test] WARN_LINE");
  EXPECT_TRUE(captured_[1].first == LogLevel::kError);
}

TEST_F(LoggerTest, DebugLevelEmitsEverything) {
  Logger::SetMinLevel(LogLevel::kDebug);
  Logger::Debug("[Test] a");
  Logger::Info("[Test] b");
  EXPECT_EQ(captured_.size(), 2u);
}

TEST_F(LoggerTest, ConcurrentLinesArriveWhole) {
  Logger::SetMinLevel(LogLevel::kInfo);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 50; ++i) {
        Logger::Info("[Test] WORKER t=" + std::to_string(t) + " i=" + std::to_string(i));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  ASSERT_EQ(captured_.size(), 200u);
  for (const auto& entry : captured_) {
    EXPECT_EQ(entry.second.rfind("[Test] WORKER t=", 0), 0u) << entry.second;
  }
}

TEST(LogLevelTest, NamesRoundTrip) {
  EXPECT_STREQ(LogLevelName(LogLevel::kWarn), "warn");
  EXPECT_TRUE(ParseLogLevel("debug") == LogLevel::kDebug);
  EXPECT_TRUE(ParseLogLevel("error") == LogLevel::kError);
  EXPECT_FALSE(ParseLogLevel("WARN").has_value());
  EXPECT_FALSE(ParseLogLevel("").has_value());
}

}  // namespace
}  // namespace clipshard::util
