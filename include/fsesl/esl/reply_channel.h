#ifndef FSESL_ESL_REPLY_CHANNEL_H
#define FSESL_ESL_REPLY_CHANNEL_H

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <utility>

#include "fsesl/core/compat.h"

namespace fsesl {
namespace esl {

/**
 * Unbuffered hand-off of one reply from the reader loop to the caller that
 * issued the command.
 *
 * Each opening of the channel is tagged with the epoch of the connection it
 * serves. send() and receive() name the epoch they belong to and fail at
 * once when it is not the current one, so a reply can never cross from one
 * connection to the next.
 *
 * send() returns only once a receiver has taken the value, so the reader
 * never runs ahead of the caller. close() wakes everybody: pending and
 * later receive() calls return nullopt and send() returns false until the
 * next reopen().
 */
template <typename T>
class ReplyChannel {
 public:
  bool send(T value, uint64_t epoch = 0) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, epoch] {
      return closed_ || epoch_ != epoch ||
             (waiting_receivers_ > 0 && !slot_.has_value());
    });
    if (closed_ || epoch_ != epoch) {
      return false;
    }
    slot_ = std::move(value);
    cv_.notify_all();
    cv_.wait(lock, [this] { return closed_ || !slot_.has_value(); });
    return true;
  }

  optional<T> receive(uint64_t epoch = 0) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || epoch_ != epoch) {
      return nullopt;
    }
    const uint64_t closes = closes_;
    ++waiting_receivers_;
    cv_.notify_all();
    cv_.wait(lock, [this, epoch, closes] {
      return slot_.has_value() || closes_ != closes || epoch_ != epoch;
    });
    --waiting_receivers_;
    if (!slot_.has_value()) {
      return nullopt;
    }
    optional<T> value = std::move(slot_);
    slot_.reset();
    cv_.notify_all();
    return value;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
  }

  // No-op when the channel has already moved on to another epoch
  void close(uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (epoch_ == epoch) {
      closeLocked();
    }
  }

  void reopen(uint64_t epoch = 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
    epoch_ = epoch;
    slot_.reset();
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  uint64_t epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
  }

 private:
  void closeLocked() {
    closed_ = true;
    ++closes_;
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  optional<T> slot_;
  size_t waiting_receivers_{0};
  uint64_t epoch_{0};
  uint64_t closes_{0};
  bool closed_{false};
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_REPLY_CHANNEL_H
