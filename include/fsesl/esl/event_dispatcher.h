#ifndef FSESL_ESL_EVENT_DISPATCHER_H
#define FSESL_ESL_EVENT_DISPATCHER_H

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "fsesl/logging/logger.h"

namespace fsesl {
namespace esl {

// Receives the raw event body (headers of the event plus any payload)
using EventHandler = std::function<void(const std::string&)>;
using EventHandlers = std::map<std::string, std::vector<EventHandler>>;

// Wildcard registration matched when no exact-name handler exists
constexpr char kAllEvents[] = "ALL";

/**
 * Routes event bodies to registered handlers.
 *
 * Lookup tries the exact Event-Name first and falls back to "ALL" only when
 * nothing is registered under the name. Every handler under the matching
 * key runs in its own detached thread; the caller never waits for them.
 * Exceptions thrown by a handler are logged and discarded.
 */
class EventDispatcher {
 public:
  explicit EventDispatcher(EventHandlers handlers,
                           logging::LoggerSharedPtr logger = nullptr);

  // Names with at least one handler, sorted
  std::vector<std::string> subscribedEvents() const;
  bool subscribesAll() const;
  bool empty() const { return subscribedEvents().empty(); }

  // Returns false when the event was dropped for lack of a handler
  bool dispatch(const std::string& event_body) const;

 private:
  const std::vector<EventHandler>* lookup(const std::string& name) const;

  EventHandlers handlers_;
  logging::LoggerSharedPtr logger_;
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_EVENT_DISPATCHER_H
