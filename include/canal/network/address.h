#ifndef CANAL_NETWORK_ADDRESS_H
#define CANAL_NETWORK_ADDRESS_H

#include <memory>
#include <string>

#include <sys/socket.h>

#include "canal/io_result.h"

namespace canal {
namespace network {
namespace Address {

class Instance;
using InstanceConstSharedPtr = std::shared_ptr<const Instance>;

enum class IpVersion { v4, v6 };

/**
 * Resolved internet socket address.
 */
class Instance {
 public:
  Instance(const sockaddr* addr, socklen_t len);

  IpVersion version() const { return version_; }
  uint32_t port() const;

  const sockaddr* sockAddr() const {
    return reinterpret_cast<const sockaddr*>(&storage_);
  }
  socklen_t sockAddrLen() const { return len_; }

  // "127.0.0.1:80" or "[::1]:80"
  std::string asString() const;
  std::string addressAsString() const;

  bool operator==(const Instance& rhs) const;

 private:
  sockaddr_storage storage_{};
  socklen_t len_;
  IpVersion version_;
};

/**
 * Parse a numeric IPv4/IPv6 address. Fails for host names.
 */
InstanceConstSharedPtr parseInternetAddress(const std::string& ip,
                                            uint16_t port);

/**
 * Resolve a host name or numeric address to the first usable stream
 * address. Errors carry the resolver message.
 */
IoResult<InstanceConstSharedPtr> resolveInternetAddress(
    const std::string& host, uint16_t port);

}  // namespace Address
}  // namespace network
}  // namespace canal

#endif  // CANAL_NETWORK_ADDRESS_H
