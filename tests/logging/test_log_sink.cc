#include <gtest/gtest.h>

#include <syslog.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "fsesl/logging/log_formatter.h"
#include "fsesl/logging/log_macros.h"
#include "fsesl/logging/log_sink.h"

using namespace fsesl::logging;
namespace fs = std::filesystem;

class TestLogSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    messages_.push_back(msg);
    last_formatted_ = formatter_->format(msg);
  }

  void flush() override { flushed_ = true; }

  SinkType type() const override { return SinkType::Null; }

  std::vector<LogMessage> messages_;
  std::string last_formatted_;
  bool flushed_ = false;
};

class LogSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_message_.level = LogLevel::Info;
    test_message_.message = "Test message";
    test_message_.logger_name = "esl.socket";
    test_message_.component = Component::Socket;
    test_message_.component_name = "connect";
  }

  void TearDown() override {
    for (const auto& file : test_files_) {
      std::error_code ec;
      fs::remove(file, ec);
      for (int i = 1; i <= 10; ++i) {
        fs::remove(file + "." + std::to_string(i), ec);
      }
    }
  }

  LogMessage test_message_;
  std::vector<std::string> test_files_;
};

TEST_F(LogSinkTest, NullSink) {
  NullSink sink;

  sink.log(test_message_);
  sink.flush();

  EXPECT_EQ(sink.type(), SinkType::Null);
  EXPECT_FALSE(sink.supportsRotation());
}

TEST_F(LogSinkTest, StdioSinkStderr) {
  std::stringstream buffer;
  std::streambuf* old = std::cerr.rdbuf(buffer.rdbuf());

  {
    StdioSink sink(StdioSink::Stderr);
    sink.log(test_message_);
    sink.flush();
  }

  std::cerr.rdbuf(old);

  std::string output = buffer.str();
  EXPECT_NE(output.find("Test message"), std::string::npos);
  EXPECT_NE(output.find("INFO"), std::string::npos);
  EXPECT_NE(output.find("[Socket.connect]"), std::string::npos);
}

TEST_F(LogSinkTest, StdioSinkStdout) {
  std::stringstream buffer;
  std::streambuf* old = std::cout.rdbuf(buffer.rdbuf());

  {
    StdioSink sink(StdioSink::Stdout);
    sink.log(test_message_);
    sink.flush();
  }

  std::cout.rdbuf(old);

  EXPECT_NE(buffer.str().find("Test message"), std::string::npos);
}

TEST_F(LogSinkTest, ExternalSink) {
  std::vector<std::string> captured_messages;
  LogLevel captured_level = LogLevel::Off;
  std::string captured_logger;

  ExternalSink sink([&](LogLevel level, const std::string& logger,
                        const std::string& msg) {
    captured_level = level;
    captured_logger = logger;
    captured_messages.push_back(msg);
  });

  sink.log(test_message_);

  ASSERT_EQ(captured_messages.size(), 1u);
  EXPECT_EQ(captured_level, LogLevel::Info);
  EXPECT_EQ(captured_logger, "esl.socket");
  EXPECT_NE(captured_messages[0].find("Test message"), std::string::npos);
  EXPECT_EQ(sink.type(), SinkType::External);
}

TEST_F(LogSinkTest, RotatingFileSinkBasic) {
  std::string test_file =
      "/tmp/fsesl_test_log_" + std::to_string(getpid()) + ".log";
  test_files_.push_back(test_file);

  RotatingFileSink::Config config;
  config.base_filename = test_file;
  config.max_file_size = 1024;
  config.max_files = 3;

  {
    RotatingFileSink sink(config);
    for (int i = 0; i < 10; ++i) {
      test_message_.message = "Message " + std::to_string(i);
      sink.log(test_message_);
    }
    sink.flush();
  }

  ASSERT_TRUE(fs::exists(test_file));

  std::ifstream file(test_file);
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("Message 9"), std::string::npos);
}

TEST_F(LogSinkTest, RotatingFileSinkRotation) {
  std::string test_file =
      "/tmp/fsesl_test_rotate_" + std::to_string(getpid()) + ".log";
  test_files_.push_back(test_file);

  RotatingFileSink::Config config;
  config.base_filename = test_file;
  config.max_file_size = 100;
  config.max_files = 2;

  {
    RotatingFileSink sink(config);
    for (int i = 0; i < 20; ++i) {
      test_message_.message =
          "This is a longer message to trigger rotation " + std::to_string(i);
      sink.log(test_message_);
    }
    sink.flush();
  }

  EXPECT_TRUE(fs::exists(test_file));
  EXPECT_TRUE(fs::exists(test_file + ".1"));
  EXPECT_FALSE(fs::exists(test_file + ".3"));
}

TEST_F(LogSinkTest, SinkFactory) {
  std::string test_file =
      "/tmp/fsesl_factory_" + std::to_string(getpid()) + ".log";
  test_files_.push_back(test_file);

  EXPECT_EQ(SinkFactory::createFileSink(test_file)->type(), SinkType::File);
  EXPECT_EQ(SinkFactory::createStdioSink(true)->type(), SinkType::Stdio);
  EXPECT_EQ(SinkFactory::createNullSink()->type(), SinkType::Null);
  EXPECT_EQ(SinkFactory::createSyslogSink("fsesl-test")->type(),
            SinkType::Syslog);
  EXPECT_EQ(SinkFactory::createExternalSink(
                [](LogLevel, const std::string&, const std::string&) {})
                ->type(),
            SinkType::External);
}

TEST_F(LogSinkTest, SyslogPriorityMapping) {
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Debug), LOG_DEBUG);
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Info), LOG_INFO);
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Notice), LOG_NOTICE);
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Warning), LOG_WARNING);
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Error), LOG_ERR);
  EXPECT_EQ(SyslogSink::toSyslogPriority(LogLevel::Emergency), LOG_EMERG);
}

TEST_F(LogSinkTest, JsonFormatter) {
  TestLogSink sink;
  sink.setFormatter(std::make_unique<JsonFormatter>());

  test_message_.remote_address = "127.0.0.1:8021";
  test_message_.event_name = "HEARTBEAT";
  test_message_.message = "quoted \"reply\"\n";

  sink.log(test_message_);

  const std::string& out = sink.last_formatted_;
  EXPECT_NE(out.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(out.find("\"remote_address\":\"127.0.0.1:8021\""),
            std::string::npos);
  EXPECT_NE(out.find("\"event_name\":\"HEARTBEAT\""), std::string::npos);
  EXPECT_NE(out.find("\"message\":\"quoted \\\"reply\\\"\\n\""),
            std::string::npos);
}

TEST_F(LogSinkTest, SyslogFormatter) {
  SyslogFormatter formatter;
  test_message_.remote_address = "10.1.1.1:8021";

  EXPECT_EQ(formatter.format(test_message_),
            "<esl.socket> [10.1.1.1:8021] Test message");
}
