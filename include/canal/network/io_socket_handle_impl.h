#ifndef CANAL_NETWORK_IO_SOCKET_HANDLE_IMPL_H
#define CANAL_NETWORK_IO_SOCKET_HANDLE_IMPL_H

#include "canal/network/io_handle.h"

namespace canal {
namespace network {

/**
 * IoHandle over a POSIX socket descriptor. Owns the descriptor.
 */
class IoSocketHandleImpl : public IoHandle {
 public:
  explicit IoSocketHandleImpl(os_fd_t fd = INVALID_SOCKET_FD);
  ~IoSocketHandleImpl() override;

  IoSocketHandleImpl(const IoSocketHandleImpl&) = delete;
  IoSocketHandleImpl& operator=(const IoSocketHandleImpl&) = delete;

  os_fd_t fd() const override { return fd_; }
  bool isOpen() const override { return fd_ != INVALID_SOCKET_FD; }

  IoCallResult read(char* buffer, size_t length) override;
  IoCallResult writev(const ConstRawSlice* slices, size_t num_slices) override;
  IoVoidResult connect(
      const Address::InstanceConstSharedPtr& address) override;
  IoVoidResult socketError() override;
  IoVoidResult shutdown(int how) override;
  IoVoidResult close() override;

 protected:
  os_fd_t fd_;
};

}  // namespace network
}  // namespace canal

#endif  // CANAL_NETWORK_IO_SOCKET_HANDLE_IMPL_H
