// Repository: Intermission
// Component: Logger tests

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "intermission/util/Logger.hpp"

namespace intermission::util {
namespace {

TEST(LoggerTest, SinksReceiveTheirLevelOnly) {
  std::vector<std::string> info;
  std::vector<std::string> warn;
  std::vector<std::string> error;
  Logger::SetInfoSink([&](const std::string& line) { info.push_back(line); });
  Logger::SetWarnSink([&](const std::string& line) { warn.push_back(line); });
  Logger::SetErrorSink([&](const std::string& line) { error.push_back(line); });

  Logger::Info("[LoggerTest] INFO_LINE");
  Logger::Warn("[LoggerTest] WARN_LINE");
  Logger::Error("[LoggerTest] ERROR_LINE");

  Logger::SetInfoSink(nullptr);
  Logger::SetWarnSink(nullptr);
  Logger::SetErrorSink(nullptr);
  Logger::Info("[LoggerTest] AFTER_CLEAR");

  ASSERT_EQ(info.size(), 1u);
  EXPECT_EQ(info[0], "[LoggerTest] INFO_LINE");
  ASSERT_EQ(warn.size(), 1u);
  EXPECT_EQ(warn[0], "[LoggerTest] WARN_LINE");
  ASSERT_EQ(error.size(), 1u);
  EXPECT_EQ(error[0], "[LoggerTest] ERROR_LINE");
}

TEST(LoggerTest, DebugToggle) {
  Logger::SetDebugEnabled(true);
  EXPECT_TRUE(Logger::IsDebugEnabled());
  Logger::Debug("[LoggerTest] DEBUG_LINE");
  Logger::SetDebugEnabled(false);
  if (std::getenv("INTERMISSION_DEBUG") == nullptr) {
    EXPECT_FALSE(Logger::IsDebugEnabled());
  }
}

}  // namespace
}  // namespace intermission::util
