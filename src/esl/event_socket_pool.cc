#include "fsesl/esl/event_socket_pool.h"

#include <utility>
#include <vector>

#include "fsesl/logging/log_macros.h"
#include "fsesl/logging/logger_registry.h"

namespace fsesl {
namespace esl {

EventSocketPool::EventSocketPool(config::PoolConfig config)
    : config_(std::move(config)),
      max_connections_(config_.max_connections < 1 ? 1
                                                   : config_.max_connections),
      logger_(logging::LoggerRegistry::instance().getOrCreateLogger(
          "esl.pool")),
      permits_(max_connections_) {}

Result<EventSocketPool::SocketPtr> EventSocketPool::acquire() {
  // Dead sockets are destroyed after the lock is released
  std::vector<SocketPtr> discarded;
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    // Idle sockets first, so a live connection is not rebuilt needlessly
    while (!idle_sockets_.empty()) {
      SocketPtr socket = std::move(idle_sockets_.front());
      idle_sockets_.pop();
      if (socket && socket->connected()) {
        return socket;
      }
      FSESL_LOG_TO(logger_, Info,
                   "Discarding idle socket to {} that lost its connection",
                   config_.socket.address);
      discarded.push_back(std::move(socket));
      ++permits_;
    }

    if (permits_ > 0) {
      --permits_;
      break;
    }

    cv_.wait(lock, [this] { return !idle_sockets_.empty() || permits_ > 0; });
  }
  lock.unlock();

  auto created = createSocket();
  if (holds_alternative<Error>(created)) {
    FSESL_LOG_TO(logger_, Error, "Could not create socket to {}: {}",
                 config_.socket.address, get<Error>(created).toString());
    {
      std::lock_guard<std::mutex> relock(mutex_);
      ++permits_;
    }
    cv_.notify_one();
    return created;
  }
  FSESL_LOG_TO(logger_, Debug, "Created socket to {}", config_.socket.address);
  return created;
}

void EventSocketPool::release(SocketPtr socket) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket && socket->connected()) {
      idle_sockets_.push(std::move(socket));
    } else {
      FSESL_LOG_TO(logger_, Info,
                   "Released socket to {} is disconnected, freeing its slot",
                   config_.socket.address);
      ++permits_;
    }
  }
  cv_.notify_one();
}

size_t EventSocketPool::idleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_sockets_.size();
}

size_t EventSocketPool::availablePermits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return permits_;
}

Result<EventSocketPool::SocketPtr> EventSocketPool::createSocket() {
  return EventSocket::create(config_.socket);
}

}  // namespace esl
}  // namespace fsesl
