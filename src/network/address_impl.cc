#include "canal/network/address.h"

#include <algorithm>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

namespace canal {
namespace network {
namespace Address {

Instance::Instance(const sockaddr* addr, socklen_t len)
    : len_(len),
      version_(addr->sa_family == AF_INET6 ? IpVersion::v6 : IpVersion::v4) {
  std::memcpy(&storage_, addr, std::min<size_t>(len, sizeof(storage_)));
}

uint32_t Instance::port() const {
  if (version_ == IpVersion::v4) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&storage_)->sin_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_port);
}

std::string Instance::addressAsString() const {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (version_ == IpVersion::v4) {
    inet_ntop(AF_INET,
              &reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr, buf,
              sizeof(buf));
  } else {
    inet_ntop(AF_INET6,
              &reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr, buf,
              sizeof(buf));
  }
  return buf;
}

std::string Instance::asString() const {
  if (version_ == IpVersion::v6) {
    return "[" + addressAsString() + "]:" + std::to_string(port());
  }
  return addressAsString() + ":" + std::to_string(port());
}

bool Instance::operator==(const Instance& rhs) const {
  return len_ == rhs.len_ && std::memcmp(&storage_, &rhs.storage_, len_) == 0;
}

InstanceConstSharedPtr parseInternetAddress(const std::string& ip,
                                            uint16_t port) {
  sockaddr_in v4{};
  if (inet_pton(AF_INET, ip.c_str(), &v4.sin_addr) == 1) {
    v4.sin_family = AF_INET;
    v4.sin_port = htons(port);
    return std::make_shared<Instance>(reinterpret_cast<const sockaddr*>(&v4),
                                      sizeof(v4));
  }

  sockaddr_in6 v6{};
  if (inet_pton(AF_INET6, ip.c_str(), &v6.sin6_addr) == 1) {
    v6.sin6_family = AF_INET6;
    v6.sin6_port = htons(port);
    return std::make_shared<Instance>(reinterpret_cast<const sockaddr*>(&v6),
                                      sizeof(v6));
  }

  return nullptr;
}

IoResult<InstanceConstSharedPtr> resolveInternetAddress(
    const std::string& host, uint16_t port) {
  // Numeric addresses need no resolver round trip
  auto numeric = parseInternetAddress(host, port);
  if (numeric) {
    return IoResult<InstanceConstSharedPtr>::success(numeric);
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    return IoResult<InstanceConstSharedPtr>::error(rc, gai_strerror(rc));
  }

  InstanceConstSharedPtr address;
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    if (ai->ai_family == AF_INET || ai->ai_family == AF_INET6) {
      address = std::make_shared<Instance>(ai->ai_addr, ai->ai_addrlen);
      break;
    }
  }
  ::freeaddrinfo(result);

  if (!address) {
    return IoResult<InstanceConstSharedPtr>::error(
        EAI_NONAME, "no usable address for " + host);
  }
  return IoResult<InstanceConstSharedPtr>::success(address);
}

}  // namespace Address
}  // namespace network
}  // namespace canal
