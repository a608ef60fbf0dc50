#include "fsesl/network/dialer.h"

#include <errno.h>

#include "fsesl/network/tcp_stream.h"

namespace fsesl {
namespace network {

IoResult<ByteStreamPtr> TcpDialer::dial(const std::string& address) {
  auto parsed = parseAddress(address);
  if (holds_alternative<Error>(parsed)) {
    return IoResult<ByteStreamPtr>::error(EINVAL,
                                          get<Error>(parsed).message);
  }
  return TcpStream::connect(get<TcpAddress>(parsed));
}

DialerSharedPtr createTcpDialer() { return std::make_shared<TcpDialer>(); }

}  // namespace network
}  // namespace fsesl
