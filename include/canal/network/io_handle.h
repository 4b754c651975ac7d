#ifndef CANAL_NETWORK_IO_HANDLE_H
#define CANAL_NETWORK_IO_HANDLE_H

#include <memory>
#include <string>

#include "canal/io_result.h"
#include "canal/network/address.h"

namespace canal {
namespace network {

class IoHandle;
using IoHandlePtr = std::unique_ptr<IoHandle>;

using os_fd_t = int;
constexpr os_fd_t INVALID_SOCKET_FD = -1;

// Read-only view of a byte range used for vectored writes
struct ConstRawSlice {
  const void* mem_{nullptr};
  size_t len_{0};
};

/**
 * Abstract interface for I/O operations on a stream socket.
 */
class IoHandle {
 public:
  virtual ~IoHandle() = default;

  virtual os_fd_t fd() const = 0;

  virtual bool isOpen() const = 0;

  /**
   * Read up to length bytes. A successful result of 0 means end of stream.
   */
  virtual IoCallResult read(char* buffer, size_t length) = 0;

  /**
   * Write data from buffer slices (vectored I/O).
   * @return Number of bytes written or error
   */
  virtual IoCallResult writev(const ConstRawSlice* slices,
                              size_t num_slices) = 0;

  /**
   * Start connecting to an address. Non-blocking sockets report
   * EINPROGRESS when the connection completes later.
   */
  virtual IoVoidResult connect(
      const Address::InstanceConstSharedPtr& address) = 0;

  /**
   * Pending socket error (SO_ERROR); success when there is none.
   */
  virtual IoVoidResult socketError() = 0;

  virtual IoVoidResult shutdown(int how) = 0;

  virtual IoVoidResult close() = 0;
};

}  // namespace network
}  // namespace canal

#endif  // CANAL_NETWORK_IO_HANDLE_H
