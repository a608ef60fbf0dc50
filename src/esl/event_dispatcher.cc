#include "fsesl/esl/event_dispatcher.h"

#include <exception>
#include <memory>
#include <thread>

#include "fsesl/esl/frame.h"
#include "fsesl/esl/text_utils.h"
#include "fsesl/logging/log_macros.h"
#include "fsesl/logging/logger_registry.h"

namespace fsesl {
namespace esl {

EventDispatcher::EventDispatcher(EventHandlers handlers,
                                 logging::LoggerSharedPtr logger)
    : handlers_(std::move(handlers)), logger_(std::move(logger)) {
  if (!logger_) {
    logger_ =
        logging::LoggerRegistry::instance().getOrCreateLogger("esl.dispatch");
  }
}

std::vector<std::string> EventDispatcher::subscribedEvents() const {
  std::vector<std::string> names;
  for (const auto& entry : handlers_) {
    if (!entry.second.empty()) {
      names.push_back(entry.first);
    }
  }
  return names;
}

bool EventDispatcher::subscribesAll() const {
  auto it = handlers_.find(kAllEvents);
  return it != handlers_.end() && !it->second.empty();
}

const std::vector<EventHandler>* EventDispatcher::lookup(
    const std::string& name) const {
  auto it = handlers_.find(name);
  if (it != handlers_.end() && !it->second.empty()) {
    return &it->second;
  }
  it = handlers_.find(kAllEvents);
  if (it != handlers_.end() && !it->second.empty()) {
    return &it->second;
  }
  return nullptr;
}

bool EventDispatcher::dispatch(const std::string& event_body) const {
  const std::string name = headerValue(event_body, headers::EVENT_NAME);
  const std::vector<EventHandler>* handlers = lookup(name);
  if (handlers == nullptr) {
    if (logger_->shouldLog(logging::LogLevel::Warning)) {
      logging::LogContext ctx;
      ctx.event_name = name;
      ctx.setLocation(__FILE__, __LINE__, __FUNCTION__);
      logger_->logWithContext(logging::LogLevel::Warning, ctx,
                              "No handler for event, dropping");
    }
    return false;
  }

  // Handlers outlive this call; each thread owns its copy of the body
  auto body = std::make_shared<const std::string>(event_body);
  for (const auto& handler : *handlers) {
    EventHandler fn = handler;
    logging::LoggerSharedPtr logger = logger_;
    std::thread([fn, body, logger, name]() {
      try {
        fn(*body);
      } catch (const std::exception& e) {
        FSESL_LOG_TO(logger, Error, "Handler for event '{}' threw: {}", name,
                     e.what());
      } catch (...) {
        FSESL_LOG_TO(logger, Error,
                     "Handler for event '{}' threw a non-standard exception",
                     name);
      }
    }).detach();
  }
  return true;
}

}  // namespace esl
}  // namespace fsesl
