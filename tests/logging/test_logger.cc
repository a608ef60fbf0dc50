#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include "fsesl/logging/log_sink.h"
#include "fsesl/logging/log_macros.h"
#include "fsesl/logging/logger.h"

using namespace fsesl::logging;

// Test sink that captures messages
class CapturingSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  void flush() override { flushed_ = true; }

  SinkType type() const override { return SinkType::Null; }

  std::vector<LogMessage> getMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  size_t messageCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
  }

  bool flushed() const { return flushed_; }

 private:
  std::mutex mutex_;
  std::vector<LogMessage> messages_;
  std::atomic<bool> flushed_{false};
};

class ThrowingSink : public LogSink {
 public:
  void log(const LogMessage&) override {
    throw std::runtime_error("disk full");
  }
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sink_ = std::make_shared<CapturingSink>();
    logger_ = std::make_shared<Logger>("test");
    logger_->setSink(sink_);
  }

  std::shared_ptr<CapturingSink> sink_;
  LoggerSharedPtr logger_;
};

TEST_F(LoggerTest, BasicLogging) {
  FSESL_LOG_TO(logger_, Info, "Test message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].level, LogLevel::Info);
  EXPECT_EQ(messages[0].message, "Test message");
  EXPECT_EQ(messages[0].logger_name, "test");
  EXPECT_NE(messages[0].file, nullptr);
  EXPECT_GT(messages[0].line, 0);
}

TEST_F(LoggerTest, LogLevels) {
  logger_->setLevel(LogLevel::Debug);

  FSESL_LOG_TO(logger_, Debug, "Debug message");
  FSESL_LOG_TO(logger_, Info, "Info message");
  FSESL_LOG_TO(logger_, Warning, "Warning message");
  FSESL_LOG_TO(logger_, Error, "Error message");
  FSESL_LOG_TO(logger_, Critical, "Critical message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 5u);

  EXPECT_EQ(messages[0].level, LogLevel::Debug);
  EXPECT_EQ(messages[1].level, LogLevel::Info);
  EXPECT_EQ(messages[2].level, LogLevel::Warning);
  EXPECT_EQ(messages[3].level, LogLevel::Error);
  EXPECT_EQ(messages[4].level, LogLevel::Critical);
}

TEST_F(LoggerTest, LogLevelFiltering) {
  logger_->setLevel(LogLevel::Warning);

  FSESL_LOG_TO(logger_, Debug, "Debug - should not appear");
  FSESL_LOG_TO(logger_, Info, "Info - should not appear");
  FSESL_LOG_TO(logger_, Warning, "Warning - should appear");
  FSESL_LOG_TO(logger_, Error, "Error - should appear");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].message, "Warning - should appear");
  EXPECT_EQ(messages[1].message, "Error - should appear");
}

TEST_F(LoggerTest, OffSuppressesEverything) {
  logger_->setLevel(LogLevel::Off);

  FSESL_LOG_TO(logger_, Critical, "never");
  EXPECT_FALSE(logger_->shouldLog(LogLevel::Emergency));
  EXPECT_EQ(sink_->messageCount(), 0u);
}

TEST_F(LoggerTest, NullLoggerIsIgnored) {
  LoggerSharedPtr none;
  FSESL_LOG_TO(none, Error, "nowhere to go");
  EXPECT_EQ(sink_->messageCount(), 0u);
}

TEST_F(LoggerTest, FormattedLogging) {
  std::string address = "10.0.0.5:8021";
  FSESL_LOG_TO(logger_, Info, "Dial {} failed (attempt {}/{})", address, 2,
               5);

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "Dial 10.0.0.5:8021 failed (attempt 2/5)");
}

TEST_F(LoggerTest, BadFormatStringDoesNotThrow) {
  EXPECT_NO_THROW(FSESL_LOG_TO(logger_, Info, "missing argument {} {}", 1));

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_NE(messages[0].message.find("format error"), std::string::npos);
}

TEST_F(LoggerTest, ContextLogging) {
  LogContext ctx;
  ctx.remote_address = "127.0.0.1:8021";
  ctx.event_name = "CHANNEL_ANSWER";
  ctx.component = Component::Socket;
  ctx.setLocation("event_socket.cc", 100, "connect");

  logger_->logWithContext(LogLevel::Info, ctx, "Context message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);

  EXPECT_EQ(messages[0].remote_address, "127.0.0.1:8021");
  EXPECT_EQ(messages[0].event_name, "CHANNEL_ANSWER");
  EXPECT_EQ(messages[0].component, Component::Socket);
  EXPECT_STREQ(messages[0].file, "event_socket.cc");
  EXPECT_EQ(messages[0].line, 100);
  EXPECT_STREQ(messages[0].function, "connect");
}

TEST_F(LoggerTest, LocationLogging) {
  logger_->log(LogLevel::Error, "file.cc", 42, "myFunc",
               "Error at specific location");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_STREQ(messages[0].file, "file.cc");
  EXPECT_EQ(messages[0].line, 42);
  EXPECT_STREQ(messages[0].function, "myFunc");
}

TEST_F(LoggerTest, ThrowingSinkDoesNotReachCaller) {
  logger_->setSink(std::make_shared<ThrowingSink>());

  EXPECT_NO_THROW(FSESL_LOG_TO(logger_, Error, "Write failed"));
}

TEST_F(LoggerTest, ThreadSafety) {
  const int num_threads = 4;
  const int messages_per_thread = 100;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t, messages_per_thread]() {
      for (int i = 0; i < messages_per_thread; ++i) {
        FSESL_LOG_TO(logger_, Info, "Thread {} message {}", t, i);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(sink_->messageCount(),
            static_cast<size_t>(num_threads * messages_per_thread));
}

TEST_F(LoggerTest, GettersAndSetters) {
  Logger logger("test_logger");

  EXPECT_EQ(logger.getName(), "test_logger");

  logger.setLevel(LogLevel::Warning);
  EXPECT_EQ(logger.getLevel(), LogLevel::Warning);

  logger.setSink(sink_);
  EXPECT_EQ(logger.getSink(), sink_);

  logger.flush();
  EXPECT_TRUE(sink_->flushed());
}
