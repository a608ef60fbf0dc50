#ifndef FSESL_NETWORK_BUFFERED_READER_H
#define FSESL_NETWORK_BUFFERED_READER_H

#include <string>
#include <vector>

#include "fsesl/network/byte_stream.h"

namespace fsesl {
namespace network {

// errno-style code reported when the peer closes mid-read
constexpr int STREAM_EOF = -1;

/**
 * Read buffer over a ByteStream with line and exact-length reads.
 *
 * Not thread-safe: owned by whichever thread currently reads the socket.
 */
class BufferedReader {
 public:
  static constexpr size_t kDefaultBufferSize = 8192;

  explicit BufferedReader(ByteStreamPtr stream,
                          size_t buffer_size = kDefaultBufferSize);

  /**
   * Append bytes up to and including the next '\n' to `line`. Fails with
   * STREAM_EOF if the stream ends before a newline.
   */
  IoVoidResult readLine(std::string& line);

  /**
   * Append exactly `len` bytes to `out`.
   */
  IoVoidResult readExact(size_t len, std::string& out);

  size_t buffered() const { return end_ - start_; }

 private:
  IoVoidResult fill();

  ByteStreamPtr stream_;
  std::vector<char> buffer_;
  size_t start_{0};
  size_t end_{0};
};

}  // namespace network
}  // namespace fsesl

#endif  // FSESL_NETWORK_BUFFERED_READER_H
