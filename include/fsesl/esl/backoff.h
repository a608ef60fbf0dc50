#ifndef FSESL_ESL_BACKOFF_H
#define FSESL_ESL_BACKOFF_H

#include <chrono>
#include <cstdint>

namespace fsesl {
namespace esl {

/**
 * Retry delays following the Fibonacci sequence: 1, 1, 2, 3, 5, 8, ...
 * units. A fresh instance is used for every connect attempt.
 */
class FibonacciBackoff {
 public:
  explicit FibonacciBackoff(
      std::chrono::milliseconds unit = std::chrono::seconds(1))
      : unit_(unit) {}

  std::chrono::milliseconds next() {
    uint64_t current = b_;
    uint64_t following = a_ + b_;
    a_ = b_;
    b_ = following;
    return unit_ * static_cast<int64_t>(current);
  }

  void reset() {
    a_ = 0;
    b_ = 1;
  }

  std::chrono::milliseconds unit() const { return unit_; }

 private:
  std::chrono::milliseconds unit_;
  uint64_t a_{0};
  uint64_t b_{1};
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_BACKOFF_H
