#ifndef FSESL_CONFIG_CONFIG_TYPES_H
#define FSESL_CONFIG_CONFIG_TYPES_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fsesl/esl/event_dispatcher.h"
#include "fsesl/logging/log_level.h"
#include "fsesl/logging/log_sink.h"
#include "fsesl/network/dialer.h"

namespace fsesl {
namespace config {

// Ordered header/value pairs, sent one filter command each
using EventFilters = std::vector<std::pair<std::string, std::string>>;

/**
 * Construction-time options of one event socket.
 */
struct EventSocketConfig {
  std::string address{"127.0.0.1:8021"};
  std::string password{"ClueCon"};

  // Dial attempts per connect; values below one are treated as one
  int reconnects{5};
  // Length of one Fibonacci step between dial attempts
  std::chrono::milliseconds backoff_unit{std::chrono::seconds(1)};

  esl::EventHandlers event_handlers;
  EventFilters event_filters;

  // Start the background reader as soon as the socket is connected
  bool read_events{false};

  // Diagnostic output; the "esl.socket" registry logger when unset
  std::shared_ptr<logging::LogSink> log_sink;

  // Transport factory; plain TCP when unset
  network::DialerSharedPtr dialer;

  int effectiveReconnects() const { return reconnects < 1 ? 1 : reconnects; }
};

struct PoolConfig {
  size_t max_connections{1};
  EventSocketConfig socket;
};

struct LoggingConfig {
  logging::LogLevel level{logging::LogLevel::Info};
  std::string sink{"stderr"};  // stderr|stdout|file|syslog|null
  std::string file;
  std::string format{"default"};  // default|json
};

/**
 * Everything a configuration file can express. Handlers are code, so the
 * file only names the events to subscribe; the caller binds handlers.
 */
struct ClientConfig {
  PoolConfig pool;
  std::vector<std::string> events;
  LoggingConfig logging;
  std::string source_file;  // empty when built from defaults
};

}  // namespace config
}  // namespace fsesl

#endif  // FSESL_CONFIG_CONFIG_TYPES_H
