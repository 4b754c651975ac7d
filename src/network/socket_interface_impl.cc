#include "canal/network/socket_interface.h"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include "canal/network/io_socket_handle_impl.h"

namespace canal {
namespace network {

IoResult<IoHandlePtr> SocketInterfaceImpl::socket(
    const Address::Instance& address) {
  int domain = address.version() == Address::IpVersion::v6 ? AF_INET6 : AF_INET;

  os_fd_t fd = ::socket(domain, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd == INVALID_SOCKET_FD) {
    return IoResult<IoHandlePtr>::from_errno(errno);
  }

  // Pipelined requests are small and latency bound
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  return IoResult<IoHandlePtr>::success(
      std::make_unique<IoSocketHandleImpl>(fd));
}

IoHandlePtr SocketInterfaceImpl::ioHandleForFd(os_fd_t fd) {
  return std::make_unique<IoSocketHandleImpl>(fd);
}

IoResult<Address::InstanceConstSharedPtr> SocketInterfaceImpl::resolve(
    const std::string& host, uint16_t port) {
  return Address::resolveInternetAddress(host, port);
}

SocketInterface& socketInterface() {
  static SocketInterfaceImpl instance;
  return instance;
}

}  // namespace network
}  // namespace canal
