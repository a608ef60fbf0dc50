#ifndef FSESL_NETWORK_BYTE_STREAM_H
#define FSESL_NETWORK_BYTE_STREAM_H

#include <cstddef>
#include <memory>
#include <string>

#include "fsesl/io_result.h"

namespace fsesl {
namespace network {

/**
 * Blocking, bidirectional byte stream.
 *
 * Thread model:
 * - One thread may block in read() while other threads call write()
 * - close() may be called from any thread and wakes a blocked reader; the
 *   descriptor itself is released when the stream is destroyed
 */
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  /**
   * Read up to `len` bytes. Blocks until at least one byte is available.
   * A successful result of zero means the peer closed the stream.
   */
  virtual IoCallResult read(char* buffer, size_t len) = 0;

  /**
   * Write the whole buffer or fail.
   */
  virtual IoVoidResult writeAll(const char* data, size_t len) = 0;

  IoVoidResult writeAll(const std::string& data) {
    return writeAll(data.data(), data.size());
  }

  /**
   * Stop both directions. Idempotent.
   */
  virtual IoVoidResult close() = 0;

  virtual bool isOpen() const = 0;
};

using ByteStreamPtr = std::shared_ptr<ByteStream>;

}  // namespace network
}  // namespace fsesl

#endif  // FSESL_NETWORK_BYTE_STREAM_H
