#ifndef FSESL_ESL_EVENT_SOCKET_POOL_H
#define FSESL_ESL_EVENT_SOCKET_POOL_H

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>

#include "fsesl/config/config_types.h"
#include "fsesl/core/result.h"
#include "fsesl/esl/event_socket.h"
#include "fsesl/logging/logger.h"

namespace fsesl {
namespace esl {

/**
 * Bounded pool of event sockets.
 *
 * The pool holds `max_connections` permits. A socket checked out, sitting
 * idle, or being created each accounts for one permit, so no more than
 * `max_connections` sockets exist at once. acquire() prefers an idle
 * socket, otherwise spends a permit on a new one, otherwise blocks until
 * release() hands back either.
 */
class EventSocketPool {
 public:
  using SocketPtr = EventSocketPtr;

  explicit EventSocketPool(config::PoolConfig config);
  virtual ~EventSocketPool() = default;

  EventSocketPool(const EventSocketPool&) = delete;
  EventSocketPool& operator=(const EventSocketPool&) = delete;

  /**
   * Blocks until a socket is available. Fails only when creating a new
   * socket fails; the permit is then returned for the next caller.
   */
  Result<SocketPtr> acquire();

  /**
   * Return a socket obtained from acquire(). Connected sockets go back to
   * the idle queue; anything else gives up its permit.
   */
  void release(SocketPtr socket);

  size_t capacity() const { return max_connections_; }
  size_t idleCount() const;
  size_t availablePermits() const;

 protected:
  // Connected socket for a fresh permit
  virtual Result<SocketPtr> createSocket();

  const config::PoolConfig& config() const { return config_; }

 private:
  config::PoolConfig config_;
  const size_t max_connections_;
  logging::LoggerSharedPtr logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<SocketPtr> idle_sockets_;
  size_t permits_;
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_EVENT_SOCKET_POOL_H
