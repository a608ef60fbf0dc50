#include <gtest/gtest.h>

#include "fsesl/logging/log_level.h"

using namespace fsesl::logging;

TEST(LogLevelTest, LogLevelToString) {
  EXPECT_STREQ(logLevelToString(LogLevel::Debug), "DEBUG");
  EXPECT_STREQ(logLevelToString(LogLevel::Info), "INFO");
  EXPECT_STREQ(logLevelToString(LogLevel::Notice), "NOTICE");
  EXPECT_STREQ(logLevelToString(LogLevel::Warning), "WARNING");
  EXPECT_STREQ(logLevelToString(LogLevel::Error), "ERROR");
  EXPECT_STREQ(logLevelToString(LogLevel::Critical), "CRITICAL");
  EXPECT_STREQ(logLevelToString(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, StringToLogLevel) {
  EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("warning"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("error"), LogLevel::Error);
  EXPECT_EQ(stringToLogLevel("off"), LogLevel::Off);

  // Invalid defaults to Info
  EXPECT_EQ(stringToLogLevel("loud"), LogLevel::Info);
  EXPECT_EQ(stringToLogLevel(""), LogLevel::Info);
}

TEST(LogLevelTest, ComponentToString) {
  EXPECT_STREQ(componentToString(Component::Root), "Root");
  EXPECT_STREQ(componentToString(Component::Socket), "Socket");
  EXPECT_STREQ(componentToString(Component::Pool), "Pool");
  EXPECT_STREQ(componentToString(Component::Dispatch), "Dispatch");
  EXPECT_STREQ(componentToString(Component::Network), "Network");
  EXPECT_STREQ(componentToString(Component::Config), "Config");
}

TEST(LogLevelTest, LogLevelOrdering) {
  EXPECT_LT(LogLevel::Debug, LogLevel::Info);
  EXPECT_LT(LogLevel::Info, LogLevel::Warning);
  EXPECT_LT(LogLevel::Warning, LogLevel::Error);
  EXPECT_LT(LogLevel::Emergency, LogLevel::Off);
}
