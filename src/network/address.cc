#include "fsesl/network/address.h"

#include <cstdlib>

namespace fsesl {
namespace network {

std::string TcpAddress::toString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

Result<TcpAddress> parseAddress(const std::string& address) {
  TcpAddress result;
  std::string port_str;

  if (!address.empty() && address[0] == '[') {
    size_t close = address.find(']');
    if (close == std::string::npos || close + 1 >= address.size() ||
        address[close + 1] != ':') {
      return makeError<TcpAddress>(errors::INVALID_ARGUMENT,
                                   "Malformed IPv6 address: " + address);
    }
    result.host = address.substr(1, close - 1);
    port_str = address.substr(close + 2);
  } else {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
      return makeError<TcpAddress>(errors::INVALID_ARGUMENT,
                                   "Missing port in address: " + address);
    }
    result.host = address.substr(0, colon);
    port_str = address.substr(colon + 1);
  }

  if (result.host.empty()) {
    return makeError<TcpAddress>(errors::INVALID_ARGUMENT,
                                 "Missing host in address: " + address);
  }
  if (port_str.empty() ||
      port_str.find_first_not_of("0123456789") != std::string::npos ||
      port_str.size() > 5) {
    return makeError<TcpAddress>(errors::INVALID_ARGUMENT,
                                 "Invalid port in address: " + address);
  }

  long port = std::strtol(port_str.c_str(), nullptr, 10);
  if (port < 1 || port > 65535) {
    return makeError<TcpAddress>(errors::INVALID_ARGUMENT,
                                 "Port out of range in address: " + address);
  }
  result.port = static_cast<uint16_t>(port);
  return result;
}

}  // namespace network
}  // namespace fsesl
