#ifndef FSESL_NETWORK_ADDRESS_H
#define FSESL_NETWORK_ADDRESS_H

#include <cstdint>
#include <string>

#include "fsesl/core/result.h"

namespace fsesl {
namespace network {

/**
 * Remote endpoint of an event socket, written "host:port".
 *
 * IPv6 literals are accepted in brackets: "[::1]:8021".
 */
struct TcpAddress {
  std::string host;
  uint16_t port{0};

  std::string toString() const;
};

/**
 * Parse "host:port". The port must be a decimal number in 1..65535 and the
 * host must be non-empty.
 */
Result<TcpAddress> parseAddress(const std::string& address);

}  // namespace network
}  // namespace fsesl

#endif  // FSESL_NETWORK_ADDRESS_H
