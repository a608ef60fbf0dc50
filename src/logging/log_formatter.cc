#include "fsesl/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fsesl {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";
  oss << "[T:" << msg.thread_id << "] ";

  if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component);
    if (!msg.component_name.empty()) {
      oss << '.' << msg.component_name;
    }
    oss << "] ";
  }

  oss << '[' << msg.logger_name << "] ";

  if (msg.file && msg.line > 0) {
    oss << '[' << msg.file << ':' << msg.line;
    if (msg.function) {
      oss << " " << msg.function << "()";
    }
    oss << "] ";
  }

  if (!msg.remote_address.empty()) {
    oss << "[fs:" << msg.remote_address << "] ";
  }
  if (!msg.event_name.empty()) {
    oss << "[event:" << msg.event_name << "] ";
  }

  oss << msg.message;

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << "{";
  oss << "\"timestamp\":\"" << formatTimestamp(msg.timestamp) << "\"";
  oss << ",\"level\":\"" << logLevelToString(msg.level) << "\"";
  oss << ",\"logger\":\"" << escapeJson(msg.logger_name) << "\"";
  oss << ",\"thread\":\"" << msg.thread_id << "\"";

  if (msg.process_id > 0) {
    oss << ",\"pid\":" << msg.process_id;
  }

  if (msg.component != Component::Root) {
    oss << ",\"component\":\"" << componentToString(msg.component) << "\"";
  }

  if (msg.file) {
    oss << ",\"file\":\"" << escapeJson(msg.file) << "\"";
    oss << ",\"line\":" << msg.line;
    if (msg.function) {
      oss << ",\"function\":\"" << escapeJson(msg.function) << "\"";
    }
  }

  if (!msg.remote_address.empty()) {
    oss << ",\"remote_address\":\"" << escapeJson(msg.remote_address) << "\"";
  }
  if (!msg.event_name.empty()) {
    oss << ",\"event_name\":\"" << escapeJson(msg.event_name) << "\"";
  }

  oss << ",\"message\":\"" << escapeJson(msg.message) << "\"";

  if (!msg.key_values.empty()) {
    oss << ",\"metadata\":{";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ",";
      oss << "\"" << escapeJson(kv.first) << "\":\"" << escapeJson(kv.second)
          << "\"";
      first = false;
    }
    oss << "}";
  }

  oss << "}";
  return oss.str();
}

std::string JsonFormatter::escapeJson(const std::string& str) const {
  std::ostringstream oss;

  for (char c : str) {
    switch (c) {
      case '"':
        oss << "\\\"";
        break;
      case '\\':
        oss << "\\\\";
        break;
      case '\n':
        oss << "\\n";
        break;
      case '\r':
        oss << "\\r";
        break;
      case '\t':
        oss << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<unsigned>(static_cast<unsigned char>(c))
              << std::dec;
        } else {
          oss << c;
        }
        break;
    }
  }

  return oss.str();
}

std::string SyslogFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;
  oss << "<" << msg.logger_name << "> ";
  if (!msg.remote_address.empty()) {
    oss << "[" << msg.remote_address << "] ";
  }
  oss << msg.message;
  return oss.str();
}

}  // namespace logging
}  // namespace fsesl
