#ifndef FSESL_NETWORK_DIALER_H
#define FSESL_NETWORK_DIALER_H

#include <memory>
#include <string>

#include "fsesl/network/address.h"
#include "fsesl/network/byte_stream.h"

namespace fsesl {
namespace network {

/**
 * Creates connected streams. Tests substitute in-process transports.
 */
class Dialer {
 public:
  virtual ~Dialer() = default;

  virtual IoResult<ByteStreamPtr> dial(const std::string& address) = 0;
};

using DialerSharedPtr = std::shared_ptr<Dialer>;

class TcpDialer : public Dialer {
 public:
  IoResult<ByteStreamPtr> dial(const std::string& address) override;
};

DialerSharedPtr createTcpDialer();

}  // namespace network
}  // namespace fsesl

#endif  // FSESL_NETWORK_DIALER_H
