#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "fsesl/logging/log_level.h"

namespace fsesl {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Event socket correlation
  std::string remote_address;
  std::string event_name;

  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context attached to log lines emitted on behalf of one socket
class LogContext {
 public:
  std::string remote_address;
  std::string event_name;

  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> key_values;

  void setLocation(const char* file, int line, const char* func) {
    source_file = file;
    source_line = line;
    source_function = func;
  }

  const char* getFile() const { return source_file; }
  int getLine() const { return source_line; }
  const char* getFunction() const { return source_function; }

  void merge(const LogContext& other) {
    if (!other.remote_address.empty())
      remote_address = other.remote_address;
    if (!other.event_name.empty())
      event_name = other.event_name;
    for (const auto& kv : other.key_values) {
      key_values[kv.first] = kv.second;
    }
  }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.component_name = component_name;
    log_msg.file = source_file;
    log_msg.line = source_line;
    log_msg.function = source_function;
    log_msg.remote_address = remote_address;
    log_msg.event_name = event_name;
    log_msg.key_values = key_values;
    return log_msg;
  }

 private:
  const char* source_file{nullptr};
  int source_line{0};
  const char* source_function{nullptr};
};

}  // namespace logging
}  // namespace fsesl
