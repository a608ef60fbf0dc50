#include "fsesl/esl/event_socket.h"

#include <utility>

#include "fsesl/esl/backoff.h"
#include "fsesl/esl/frame_reader.h"
#include "fsesl/esl/text_utils.h"
#include "fsesl/logging/log_macros.h"
#include "fsesl/logging/logger_registry.h"
#include "fsesl/network/dialer.h"

namespace fsesl {
namespace esl {

namespace {

constexpr char kLoggerName[] = "esl.socket";
constexpr char kAuthAccepted[] = "+OK accepted";

logging::LoggerSharedPtr makeLogger(const config::EventSocketConfig& config) {
  auto& registry = logging::LoggerRegistry::instance();
  if (!config.log_sink) {
    return registry.getOrCreateLogger(kLoggerName);
  }
  auto logger = std::make_shared<logging::Logger>(kLoggerName);
  logger->setLevel(registry.getEffectiveLevel(kLoggerName));
  logger->setSink(config.log_sink);
  return logger;
}

}  // namespace

const char* socketStateToString(SocketState state) {
  switch (state) {
    case SocketState::Disconnected: return "Disconnected";
    case SocketState::Connecting: return "Connecting";
    case SocketState::Authenticating: return "Authenticating";
    case SocketState::Subscribing: return "Subscribing";
    case SocketState::Filtering: return "Filtering";
    case SocketState::Ready: return "Ready";
    case SocketState::Streaming: return "Streaming";
  }
  return "Unknown";
}

Result<EventSocketPtr> EventSocket::create(
    const config::EventSocketConfig& config) {
  auto socket = std::make_shared<EventSocket>(config);
  auto connected = socket->connect();
  if (holds_alternative<Error>(connected)) {
    return get<Error>(connected);
  }
  if (config.read_events) {
    auto started = socket->startReading();
    if (holds_alternative<Error>(started)) {
      return get<Error>(started);
    }
  }
  return socket;
}

EventSocket::EventSocket(config::EventSocketConfig config)
    : config_(std::move(config)),
      logger_(makeLogger(config_)),
      dispatcher_(config_.event_handlers, logger_),
      dialer_(config_.dialer ? config_.dialer : network::createTcpDialer()) {}

EventSocket::~EventSocket() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  disconnect();

  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (reader_thread_.joinable()) {
    if (reader_thread_.get_id() == std::this_thread::get_id()) {
      reader_thread_.detach();
    } else {
      reader_thread_.join();
    }
  }
}

VoidResult EventSocket::connect() {
  disconnect_requested_ = false;
  std::lock_guard<std::mutex> lock(connect_mutex_);
  return connectLocked();
}

VoidResult EventSocket::connectLocked() {
  closeStream();
  state_ = SocketState::Connecting;

  FibonacciBackoff backoff(config_.backoff_unit);
  const int attempts = config_.effectiveReconnects();
  network::ByteStreamPtr stream;
  for (int attempt = 1;; ++attempt) {
    auto dialed = dialer_->dial(config_.address);
    if (dialed.ok()) {
      stream = *dialed;
      break;
    }
    Error err = ioResultToError(dialed);
    if (attempt >= attempts) {
      state_ = SocketState::Disconnected;
      FSESL_LOG_TO(logger_, Error,
                   "Could not connect to {} after {} attempts: {}",
                   config_.address, attempts, err.message);
      return makeVoidError(err.code, "Dial " + config_.address +
                                         " failed: " + err.message);
    }
    auto delay = backoff.next();
    FSESL_LOG_TO(logger_, Warning,
                 "Dial {} failed (attempt {}/{}): {}, retrying in {}ms",
                 config_.address, attempt, attempts, err.message,
                 delay.count());
    if (!interruptibleSleep(delay)) {
      state_ = SocketState::Disconnected;
      return makeVoidError(errors::TRANSPORT_ERROR,
                           "Connect to " + config_.address + " interrupted");
    }
  }

  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_ = stream;
    reader_ = std::make_shared<network::BufferedReader>(stream);
    generation = ++generation_;
  }
  FSESL_LOG_TO(logger_, Info, "Connected to {}", config_.address);

  auto shaken = handshake(generation);
  if (holds_alternative<Error>(shaken)) {
    FSESL_LOG_TO(logger_, Error, "Handshake with {} failed: {}",
                 config_.address, get<Error>(shaken).toString());
    closeStream(generation);
    return shaken;
  }

  // Replies owed by the previous connection stay failed
  api_replies_.reopen(generation);
  cmd_replies_.reopen(generation);
  state_ = loop_active_ ? SocketState::Streaming : SocketState::Ready;
  return makeVoidSuccess();
}

VoidResult EventSocket::handshake(uint64_t generation) {
  state_ = SocketState::Authenticating;
  auto result = authenticate(generation);
  if (holds_alternative<Error>(result)) {
    return result;
  }

  state_ = SocketState::Subscribing;
  result = subscribe(generation);
  if (holds_alternative<Error>(result)) {
    return result;
  }

  state_ = SocketState::Filtering;
  return installFilters(generation);
}

VoidResult EventSocket::authenticate(uint64_t generation) {
  auto challenge = readFrame(generation);
  if (holds_alternative<Error>(challenge)) {
    const Error& err = get<Error>(challenge);
    return makeVoidError(err.code,
                         "No auth challenge received: " + err.message);
  }
  const Frame& frame = get<Frame>(challenge);
  if (frame.contentType() != content_types::AUTH_REQUEST) {
    return makeVoidError(errors::PROTOCOL_ERROR,
                         "No auth challenge received: <" + frame.raw_headers +
                             ">");
  }
  return expectReply("auth " + config_.password, kAuthAccepted, "auth",
                     generation);
}

VoidResult EventSocket::subscribe(uint64_t generation) {
  std::vector<std::string> names = dispatcher_.subscribedEvents();
  if (names.empty()) {
    return makeVoidSuccess();
  }

  std::string command = "event plain";
  if (dispatcher_.subscribesAll()) {
    command += " all";
  } else {
    for (const auto& name : names) {
      command += " " + name;
    }
  }
  return expectReply(command, REPLY_OK, "events-subscribe", generation);
}

VoidResult EventSocket::installFilters(uint64_t generation) {
  for (const auto& filter : config_.event_filters) {
    auto result = expectReply("filter " + filter.first + " " + filter.second,
                              REPLY_OK, "filter-events", generation);
    if (holds_alternative<Error>(result)) {
      return result;
    }
  }
  return makeVoidSuccess();
}

VoidResult EventSocket::expectReply(const std::string& command,
                                    const char* expected,
                                    const char* phase,
                                    uint64_t generation) {
  auto written = write(command + "\n\n", generation);
  if (holds_alternative<Error>(written)) {
    return written;
  }
  auto reply = readReply(content_types::COMMAND_REPLY, generation);
  if (holds_alternative<Error>(reply)) {
    return get<Error>(reply);
  }
  const Frame& frame = get<Frame>(reply);
  if (!startsWith(frame.replyText(), expected)) {
    return makeVoidError(errors::PROTOCOL_ERROR,
                         std::string("Unexpected ") + phase +
                             " reply received: <" + frame.raw_headers + ">");
  }
  return makeVoidSuccess();
}

void EventSocket::disconnect() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    disconnect_requested_ = true;
  }
  stop_cv_.notify_all();
  closeStream();
  api_replies_.close();
  cmd_replies_.close();
}

void EventSocket::closeStream() {
  network::ByteStreamPtr stream;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream.swap(stream_);
    reader_.reset();
    state_ = SocketState::Disconnected;
  }
  finishClose(std::move(stream));
}

void EventSocket::closeStream(uint64_t generation) {
  network::ByteStreamPtr stream;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (generation != generation_ || !stream_) {
      return;
    }
    stream.swap(stream_);
    reader_.reset();
    state_ = SocketState::Disconnected;
  }
  finishClose(std::move(stream));
}

void EventSocket::finishClose(network::ByteStreamPtr stream) {
  if (!stream) {
    return;
  }
  auto closed = stream->close();
  if (!closed.ok()) {
    FSESL_LOG_TO(logger_, Debug, "Closing stream to {}: {}", config_.address,
                 closed.error_info->message);
  }
  FSESL_LOG_TO(logger_, Info, "Disconnected from {}", config_.address);
}

bool EventSocket::connected() const { return liveGeneration().has_value(); }

optional<uint64_t> EventSocket::liveGeneration() const {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!stream_) {
    return nullopt;
  }
  SocketState state = state_.load();
  if (state != SocketState::Ready && state != SocketState::Streaming) {
    return nullopt;
  }
  return generation_;
}

uint64_t EventSocket::currentGeneration() const {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  return generation_;
}

bool EventSocket::stopRequested() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  return stopping_ || disconnect_requested_;
}

bool EventSocket::interruptibleSleep(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [this] {
    return stopping_ || disconnect_requested_.load();
  });
}

VoidResult EventSocket::write(const std::string& data, uint64_t generation) {
  network::ByteStreamPtr stream;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (generation == generation_) {
      stream = stream_;
    }
  }
  if (!stream) {
    return makeVoidError(errors::TRANSPORT_ERROR,
                         "Not connected to " + config_.address);
  }
  auto written = stream->writeAll(data);
  if (!written.ok()) {
    Error err = ioResultToError(written);
    FSESL_LOG_TO(logger_, Error, "Write to {} failed: {}", config_.address,
                 err.message);
    closeStream(generation);
    return makeVoidError(err);
  }
  return makeVoidSuccess();
}

Result<Frame> EventSocket::readFrame(uint64_t generation) {
  ReaderPtr reader;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (generation == generation_) {
      reader = reader_;
    }
  }
  if (!reader) {
    return makeError<Frame>(errors::TRANSPORT_ERROR,
                            "Not connected to " + config_.address);
  }

  FrameReader frames(*reader);
  auto frame = frames.readFrame();
  if (holds_alternative<Error>(frame)) {
    closeStream(generation);
  }
  return frame;
}

Result<Frame> EventSocket::readReply(const char* content_type,
                                     uint64_t generation) {
  for (;;) {
    auto result = readFrame(generation);
    if (holds_alternative<Error>(result)) {
      return result;
    }
    const Frame& frame = get<Frame>(result);
    const std::string type = frame.contentType();
    if (type == content_type) {
      return result;
    }
    if (type == content_types::API_RESPONSE ||
        type == content_types::COMMAND_REPLY) {
      FSESL_LOG_TO(logger_, Warning,
                   "Discarding {} from {} while waiting for {}", type,
                   config_.address, content_type);
      continue;
    }
    routeEvent(frame);
  }
}

void EventSocket::routeEvent(const Frame& frame) {
  if (frame.contentType() == content_types::DISCONNECT_NOTICE) {
    FSESL_LOG_TO(logger_, Info, "{} announced disconnect", config_.address);
    return;
  }
  if (frame.body.empty()) {
    return;
  }
  dispatcher_.dispatch(frame.body);
}

Result<std::string> EventSocket::sendApiCmd(const std::string& command) {
  std::lock_guard<std::mutex> lock(command_mutex_);
  auto generation = liveGeneration();
  if (!generation) {
    return makeError<std::string>(errors::TRANSPORT_ERROR,
                                  "Not connected to " + config_.address);
  }
  auto written = write("api " + command + "\n\n", *generation);
  if (holds_alternative<Error>(written)) {
    return get<Error>(written);
  }

  std::string body;
  if (loop_active_) {
    auto reply = api_replies_.receive(*generation);
    if (!reply) {
      return makeError<std::string>(
          errors::TRANSPORT_ERROR,
          "Connection to " + config_.address + " lost before api reply");
    }
    body = std::move(*reply);
  } else {
    auto reply = readReply(content_types::API_RESPONSE, *generation);
    if (holds_alternative<Error>(reply)) {
      return get<Error>(reply);
    }
    body = std::move(get<Frame>(reply).body);
  }

  if (startsWith(body, REPLY_ERR)) {
    FSESL_LOG_TO(logger_, Debug, "api {} failed: {}", command, trim(body));
    return makeError<std::string>(errors::COMMAND_FAILED,
                                  "Command failed: " + trim(body));
  }
  return body;
}

VoidResult EventSocket::sendMsgCmd(
    const std::string& uuid, const std::map<std::string, std::string>& args) {
  if (args.empty()) {
    return makeVoidError(errors::INVALID_ARGUMENT, "Need command arguments");
  }
  std::lock_guard<std::mutex> lock(command_mutex_);
  auto generation = liveGeneration();
  if (!generation) {
    return makeVoidError(errors::TRANSPORT_ERROR,
                         "Not connected to " + config_.address);
  }

  std::string command = "sendmsg " + uuid + "\n";
  for (const auto& arg : args) {
    command += arg.first + ":" + arg.second + "\n";
  }
  auto written = write(command + "\n", *generation);
  if (holds_alternative<Error>(written)) {
    return written;
  }

  std::string reply_text;
  if (loop_active_) {
    auto reply = cmd_replies_.receive(*generation);
    if (!reply) {
      return makeVoidError(errors::TRANSPORT_ERROR,
                           "Connection to " + config_.address +
                               " lost before sendmsg reply");
    }
    reply_text = std::move(*reply);
  } else {
    auto reply = readReply(content_types::COMMAND_REPLY, *generation);
    if (holds_alternative<Error>(reply)) {
      return get<Error>(reply);
    }
    reply_text = get<Frame>(reply).replyText();
  }

  if (startsWith(reply_text, REPLY_ERR)) {
    return makeVoidError(errors::COMMAND_FAILED, "SendMessage: " + reply_text);
  }
  return makeVoidSuccess();
}

VoidResult EventSocket::startReading() {
  // Waits out an inline command so it keeps the reply it is reading
  std::lock_guard<std::mutex> command_lock(command_mutex_);
  std::lock_guard<std::mutex> lock(thread_mutex_);
  uint64_t generation = 0;
  auto begun = beginReading(&generation);
  if (holds_alternative<Error>(begun)) {
    return begun;
  }
  // A previous loop has finished; reap its thread
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  // The loop logs its own exit reason
  reader_thread_ = std::thread([this, generation]() { runLoop(generation); });
  return makeVoidSuccess();
}

VoidResult EventSocket::readEvents() {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    auto begun = beginReading(&generation);
    if (holds_alternative<Error>(begun)) {
      return begun;
    }
  }
  return runLoop(generation);
}

VoidResult EventSocket::beginReading(uint64_t* generation) {
  std::lock_guard<std::mutex> lock(connect_mutex_);
  auto live = liveGeneration();
  if (!live) {
    return makeVoidError(errors::TRANSPORT_ERROR,
                         "Not connected to " + config_.address);
  }
  bool expected = false;
  if (!loop_active_.compare_exchange_strong(expected, true)) {
    return makeVoidError(errors::INVALID_ARGUMENT,
                         "Event reader already running");
  }
  api_replies_.reopen(*live);
  cmd_replies_.reopen(*live);
  SocketState ready = SocketState::Ready;
  state_.compare_exchange_strong(ready, SocketState::Streaming);
  *generation = *live;
  return makeVoidSuccess();
}

VoidResult EventSocket::runLoop(uint64_t generation) {
  FSESL_LOG_TO(logger_, Debug, "Reading events from {}", config_.address);

  VoidResult outcome = makeVoidSuccess();
  for (;;) {
    auto result = readFrame(generation);
    if (holds_alternative<Error>(result)) {
      const Error& err = get<Error>(result);
      api_replies_.close(generation);
      cmd_replies_.close(generation);
      if (stopRequested()) {
        outcome = err;
        break;
      }

      VoidResult reconnected = makeVoidSuccess();
      {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        auto live = liveGeneration();
        if (live && *live != generation) {
          FSESL_LOG_TO(logger_, Debug, "Following new connection to {}",
                       config_.address);
          generation = *live;
          continue;
        }
        FSESL_LOG_TO(logger_, Error, "Error reading events from {}: {}",
                     config_.address, err.toString());
        reconnected = connectLocked();
        generation = currentGeneration();
      }
      if (holds_alternative<Error>(reconnected)) {
        outcome = reconnected;
        break;
      }
      if (stopRequested()) {
        closeStream(generation);
        outcome = makeVoidError(errors::TRANSPORT_ERROR,
                                "Disconnected from " + config_.address);
        break;
      }
      continue;
    }

    Frame& frame = get<Frame>(result);
    const std::string type = frame.contentType();
    if (type == content_types::API_RESPONSE) {
      if (!api_replies_.send(std::move(frame.body), generation)) {
        FSESL_LOG_TO(logger_, Warning, "Dropped api reply from {}",
                     config_.address);
      }
    } else if (type == content_types::COMMAND_REPLY) {
      if (!cmd_replies_.send(frame.replyText(), generation)) {
        FSESL_LOG_TO(logger_, Warning, "Dropped command reply from {}",
                     config_.address);
      }
    } else {
      routeEvent(frame);
    }
  }

  api_replies_.close();
  cmd_replies_.close();
  if (holds_alternative<Error>(outcome)) {
    FSESL_LOG_TO(logger_, Info, "Stopped reading events from {}: {}",
                 config_.address, get<Error>(outcome).message);
  }
  loop_active_ = false;
  return outcome;
}

}  // namespace esl
}  // namespace fsesl
