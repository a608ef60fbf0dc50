#ifndef FSESL_ESL_EVENT_SOCKET_H
#define FSESL_ESL_EVENT_SOCKET_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "fsesl/config/config_types.h"
#include "fsesl/core/compat.h"
#include "fsesl/core/result.h"
#include "fsesl/esl/event_dispatcher.h"
#include "fsesl/esl/frame.h"
#include "fsesl/esl/reply_channel.h"
#include "fsesl/logging/logger.h"
#include "fsesl/network/buffered_reader.h"
#include "fsesl/network/byte_stream.h"

namespace fsesl {
namespace esl {

enum class SocketState {
  Disconnected,
  Connecting,
  Authenticating,
  Subscribing,
  Filtering,
  Ready,      // handshake done, no background reader
  Streaming,  // background reader running
};

const char* socketStateToString(SocketState state);

class EventSocket;
using EventSocketPtr = std::shared_ptr<EventSocket>;

/**
 * One authenticated event-socket connection.
 *
 * Owns the TCP stream, the handshake (auth, subscribe, filter) and the
 * reconnect procedure. readEvents() is the demultiplexer: it routes API
 * replies and command replies to the caller blocked in sendApiCmd() or
 * sendMsgCmd(), and hands everything else with a body to the dispatcher.
 *
 * Thread model:
 * - At most one reader loop runs at a time
 * - Commands are serialized; one outstanding command per socket
 * - disconnect() may be called from any thread
 *
 * Without a running reader loop, commands read their own reply inline and
 * dispatch any events that arrive before it.
 *
 * Every connection gets a new generation. Reads, writes, teardown and the
 * reply channels are tied to the generation they started on, so work left
 * over from a replaced connection fails instead of touching its successor.
 * Lock order: command_mutex_, thread_mutex_, connect_mutex_, stream_mutex_.
 */
class EventSocket {
 public:
  // Connects and, when configured, starts the background reader
  static Result<EventSocketPtr> create(const config::EventSocketConfig& config);

  // Unconnected socket; call connect() before use
  explicit EventSocket(config::EventSocketConfig config);
  ~EventSocket();

  EventSocket(const EventSocket&) = delete;
  EventSocket& operator=(const EventSocket&) = delete;

  /**
   * Dial with Fibonacci backoff, then authenticate, subscribe and install
   * filters. An existing connection is dropped first. Any handshake
   * failure leaves the socket disconnected.
   */
  VoidResult connect();

  // Idempotent; also stops the reader loop from reconnecting
  void disconnect();

  bool connected() const;
  SocketState state() const { return state_.load(); }
  const std::string& address() const { return config_.address; }

  // Body of the api/response reply; COMMAND_FAILED when it reads -ERR
  Result<std::string> sendApiCmd(const std::string& command);

  // sendmsg with "name:value" lines; INVALID_ARGUMENT when args is empty
  VoidResult sendMsgCmd(const std::string& uuid,
                        const std::map<std::string, std::string>& args);

  // Runs readEvents() on a background thread
  VoidResult startReading();

  /**
   * Demultiplexer loop. Blocks until the connection is lost for good:
   * after a read failure it reconnects once and resumes, otherwise returns
   * the failure. Replies pending at exit are failed with TRANSPORT_ERROR.
   */
  VoidResult readEvents();

  bool reading() const { return loop_active_.load(); }

  const EventDispatcher& dispatcher() const { return dispatcher_; }

 private:
  using ReaderPtr = std::shared_ptr<network::BufferedReader>;

  VoidResult connectLocked();
  VoidResult handshake(uint64_t generation);
  VoidResult authenticate(uint64_t generation);
  VoidResult subscribe(uint64_t generation);
  VoidResult installFilters(uint64_t generation);

  // Reader loop body; loop_active_ is already set by the caller
  VoidResult runLoop(uint64_t generation);

  // Generation of the live connection; nullopt unless connected()
  optional<uint64_t> liveGeneration() const;
  uint64_t currentGeneration() const;

  // Reads one frame from `generation`; a read failure tears it down
  Result<Frame> readFrame(uint64_t generation);
  // Reads until a frame with `content_type` arrives, routing events seen
  Result<Frame> readReply(const char* content_type, uint64_t generation);
  // Sends `command` and requires a Reply-Text starting with `expected`
  VoidResult expectReply(const std::string& command,
                         const char* expected,
                         const char* phase,
                         uint64_t generation);

  VoidResult write(const std::string& data, uint64_t generation);
  void closeStream();
  // Only closes the stream when it still belongs to `generation`
  void closeStream(uint64_t generation);
  void finishClose(network::ByteStreamPtr stream);
  bool stopRequested();
  // False when interrupted by disconnect() or destruction
  bool interruptibleSleep(std::chrono::milliseconds delay);
  void routeEvent(const Frame& frame);
  // Claims the reader role for the live connection; needs command_mutex_
  VoidResult beginReading(uint64_t* generation);

  config::EventSocketConfig config_;
  logging::LoggerSharedPtr logger_;
  EventDispatcher dispatcher_;
  network::DialerSharedPtr dialer_;

  mutable std::mutex stream_mutex_;
  network::ByteStreamPtr stream_;
  ReaderPtr reader_;
  // Bumped for every stream installed by connectLocked()
  uint64_t generation_{0};

  std::mutex connect_mutex_;
  std::mutex command_mutex_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_{false};
  std::atomic<bool> disconnect_requested_{false};

  std::atomic<SocketState> state_{SocketState::Disconnected};
  std::atomic<bool> loop_active_{false};
  std::mutex thread_mutex_;
  std::thread reader_thread_;

  ReplyChannel<std::string> api_replies_;
  ReplyChannel<std::string> cmd_replies_;
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_EVENT_SOCKET_H
