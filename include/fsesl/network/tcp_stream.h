#ifndef FSESL_NETWORK_TCP_STREAM_H
#define FSESL_NETWORK_TCP_STREAM_H

#include <atomic>

#include "fsesl/network/address.h"
#include "fsesl/network/byte_stream.h"

namespace fsesl {
namespace network {

/**
 * ByteStream over a connected stream socket descriptor.
 *
 * The descriptor stays in blocking mode; the event socket protocol is a
 * strict request/reply exchange plus one dedicated reader thread.
 */
class TcpStream : public ByteStream {
 public:
  explicit TcpStream(int fd);
  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  /**
   * Resolve and connect to `address`, trying every resolved endpoint.
   */
  static IoResult<ByteStreamPtr> connect(const TcpAddress& address);

  IoCallResult read(char* buffer, size_t len) override;
  IoVoidResult writeAll(const char* data, size_t len) override;
  using ByteStream::writeAll;
  IoVoidResult close() override;
  bool isOpen() const override { return !closed_.load(); }

  int fd() const { return fd_; }

 private:
  // The descriptor is released in the destructor only, so a reader blocked
  // in recv() never races with descriptor reuse.
  const int fd_;
  std::atomic<bool> closed_{false};
};

}  // namespace network
}  // namespace fsesl

#endif  // FSESL_NETWORK_TCP_STREAM_H
