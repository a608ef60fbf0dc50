#include "fsesl/network/tcp_stream.h"

#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

namespace fsesl {
namespace network {

TcpStream::TcpStream(int fd) : fd_(fd) {}

TcpStream::~TcpStream() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

IoResult<ByteStreamPtr> TcpStream::connect(const TcpAddress& address) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  std::string port = std::to_string(address.port);
  int rc = ::getaddrinfo(address.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    return IoResult<ByteStreamPtr>::error(
        EHOSTUNREACH, std::string("Cannot resolve ") + address.host + ": " +
                          ::gai_strerror(rc));
  }

  int last_error = ECONNREFUSED;
  int connected_fd = -1;
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected_fd = fd;
      break;
    }
    last_error = errno;
    ::close(fd);
  }
  ::freeaddrinfo(res);

  if (connected_fd < 0) {
    return IoResult<ByteStreamPtr>::error(
        last_error, std::string("Cannot connect to ") + address.toString() +
                        ": " + std::strerror(last_error));
  }

  // Commands are tiny; do not let Nagle hold them back
  int nodelay = 1;
  ::setsockopt(connected_fd, IPPROTO_TCP, TCP_NODELAY, &nodelay,
               sizeof(nodelay));

  return IoResult<ByteStreamPtr>::success(
      std::make_shared<TcpStream>(connected_fd));
}

IoCallResult TcpStream::read(char* buffer, size_t len) {
  if (closed_.load()) {
    return IoCallResult::error(EBADF);
  }
  for (;;) {
    ssize_t n = ::recv(fd_, buffer, len, 0);
    if (n >= 0) {
      return IoCallResult::success(static_cast<size_t>(n));
    }
    if (errno != EINTR) {
      return IoCallResult::from_errno(errno);
    }
  }
}

IoVoidResult TcpStream::writeAll(const char* data, size_t len) {
  if (closed_.load()) {
    return IoVoidResult::error(EBADF);
  }
  size_t off = 0;
  while (off < len) {
    ssize_t n = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IoVoidResult::from_errno(errno);
    }
    if (n == 0) {
      return IoVoidResult::error(EPIPE);
    }
    off += static_cast<size_t>(n);
  }
  return IoVoidResult::success();
}

IoVoidResult TcpStream::close() {
  if (closed_.exchange(true)) {
    return IoVoidResult::success();
  }
  if (fd_ >= 0 && ::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

}  // namespace network
}  // namespace fsesl
