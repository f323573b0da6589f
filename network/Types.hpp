#pragma once

#include "Utilities.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace dt {
namespace network {

struct IpEndpoint {
  std::string address;
  uint16_t port{0};

  std::string toString() const {
    return address + ":" + std::to_string(port);
  }

  /** Parse "host:port"; std::nullopt on a missing host or invalid port */
  static std::optional<IpEndpoint> fromString(const std::string &endpointStr) {
    IpEndpoint endpoint;
    if (!utl::parseHostPort(endpointStr, endpoint.address, endpoint.port)) {
      return std::nullopt;
    }
    return endpoint;
  }

  bool operator==(const IpEndpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const IpEndpoint &other) const { return !(*this == other); }
  bool operator<(const IpEndpoint &other) const {
    return address != other.address ? address < other.address
                                    : port < other.port;
  }
};

inline std::ostream &operator<<(std::ostream &os, const IpEndpoint &endpoint) {
  return os << endpoint.address << ":" << endpoint.port;
}

} // namespace network
} // namespace dt
