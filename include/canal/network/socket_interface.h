#ifndef CANAL_NETWORK_SOCKET_INTERFACE_H
#define CANAL_NETWORK_SOCKET_INTERFACE_H

#include "canal/network/address.h"
#include "canal/network/io_handle.h"

namespace canal {
namespace network {

/**
 * Creates non-blocking stream sockets. Replaceable so that tests can hand
 * out pre-connected socket pairs.
 */
class SocketInterface {
 public:
  virtual ~SocketInterface() = default;

  /**
   * Create a non-blocking, close-on-exec stream socket for the address
   * family of the given address.
   */
  virtual IoResult<IoHandlePtr> socket(const Address::Instance& address) = 0;

  /**
   * Wrap an existing descriptor. The handle takes ownership.
   */
  virtual IoHandlePtr ioHandleForFd(os_fd_t fd) = 0;

  /**
   * Resolve the remote address of an outbound connection.
   */
  virtual IoResult<Address::InstanceConstSharedPtr> resolve(
      const std::string& host, uint16_t port) = 0;
};

class SocketInterfaceImpl : public SocketInterface {
 public:
  IoResult<IoHandlePtr> socket(const Address::Instance& address) override;
  IoHandlePtr ioHandleForFd(os_fd_t fd) override;
  IoResult<Address::InstanceConstSharedPtr> resolve(const std::string& host,
                                                    uint16_t port) override;
};

/**
 * Process-wide default socket interface.
 */
SocketInterface& socketInterface();

}  // namespace network
}  // namespace canal

#endif  // CANAL_NETWORK_SOCKET_INTERFACE_H
