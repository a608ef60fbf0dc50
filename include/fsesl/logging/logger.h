#pragma once

#include <atomic>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "fsesl/logging/log_level.h"
#include "fsesl/logging/log_message.h"
#include "fsesl/logging/log_sink.h"

namespace fsesl {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name)
      : effective_level_(LogLevel::Info), name_(name) {}

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* fmt,
                      Args&&... args) {
    if (shouldLog(level)) {
      auto msg =
          ctx.toLogMessage(level, format(fmt, std::forward<Args>(args)...));
      msg.logger_name = name_;
      logMessage(msg);
    }
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = format(fmt, std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  bool shouldLog(LogLevel level) const {
    LogLevel current = effective_level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 protected:
  // A sink that throws must not disturb the caller; the failure goes to
  // stderr instead
  void logMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
      return;
    }
    try {
      sink_->log(msg);
    } catch (const std::exception& e) {
      fmt::print(stderr, "[{}] log sink failed: {}\n", name_, e.what());
    }
  }

 private:
  template <typename... Args>
  static std::string format(const char* fmt, Args&&... args) {
    try {
      return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    } catch (const fmt::format_error& e) {
      return std::string(fmt) + " [format error: " + e.what() + "]";
    }
  }

  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  mutable std::mutex sink_mutex_;
};

using LoggerSharedPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace fsesl
