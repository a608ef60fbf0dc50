#pragma once

#include <string>

#include "fsesl/logging/log_message.h"

namespace fsesl {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// Single line: timestamp, level, thread, component, logger, location, message
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line for structured collectors
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;

 private:
  std::string escapeJson(const std::string& str) const;
};

// Syslog supplies timestamp and pid itself, so only the essentials go out
class SyslogFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace fsesl
