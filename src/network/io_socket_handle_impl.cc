#include "canal/network/io_socket_handle_impl.h"

#include <algorithm>
#include <cerrno>

#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

namespace canal {
namespace network {

namespace {

constexpr size_t MAX_IOV = 64;

}  // namespace

IoSocketHandleImpl::IoSocketHandleImpl(os_fd_t fd) : fd_(fd) {}

IoSocketHandleImpl::~IoSocketHandleImpl() {
  if (isOpen()) {
    ::close(fd_);
    fd_ = INVALID_SOCKET_FD;
  }
}

IoCallResult IoSocketHandleImpl::read(char* buffer, size_t length) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF, "socket closed");
  }

  while (true) {
    ssize_t result = ::recv(fd_, buffer, length, 0);
    if (result >= 0) {
      return IoCallResult::success(static_cast<size_t>(result));
    }
    if (errno != EINTR) {
      return IoCallResult::from_errno(errno);
    }
  }
}

IoCallResult IoSocketHandleImpl::writev(const ConstRawSlice* slices,
                                        size_t num_slices) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF, "socket closed");
  }

  if (num_slices == 0) {
    return IoCallResult::success(0);
  }

  num_slices = std::min(num_slices, MAX_IOV);

  iovec iov[MAX_IOV];
  for (size_t i = 0; i < num_slices; ++i) {
    iov[i].iov_base = const_cast<void*>(slices[i].mem_);
    iov[i].iov_len = slices[i].len_;
  }

  msghdr message{};
  message.msg_iov = iov;
  message.msg_iovlen = num_slices;

  while (true) {
    // MSG_NOSIGNAL: a peer that went away must surface as EPIPE, not SIGPIPE
    ssize_t result = ::sendmsg(fd_, &message, MSG_NOSIGNAL);
    if (result >= 0) {
      return IoCallResult::success(static_cast<size_t>(result));
    }
    if (errno != EINTR) {
      return IoCallResult::from_errno(errno);
    }
  }
}

IoVoidResult IoSocketHandleImpl::connect(
    const Address::InstanceConstSharedPtr& address) {
  if (!isOpen()) {
    return IoVoidResult::error(EBADF, "socket closed");
  }

  int result = ::connect(fd_, address->sockAddr(), address->sockAddrLen());
  if (result == 0) {
    // Immediate success (common for loopback)
    return IoVoidResult::success();
  }
  return IoVoidResult::from_errno(errno);
}

IoVoidResult IoSocketHandleImpl::socketError() {
  if (!isOpen()) {
    return IoVoidResult::error(EBADF, "socket closed");
  }

  int error = 0;
  socklen_t len = sizeof(error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
    return IoVoidResult::from_errno(errno);
  }
  if (error != 0) {
    return IoVoidResult::from_errno(error);
  }
  return IoVoidResult::success();
}

IoVoidResult IoSocketHandleImpl::shutdown(int how) {
  if (!isOpen()) {
    return IoVoidResult::error(EBADF, "socket closed");
  }
  if (::shutdown(fd_, how) != 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

IoVoidResult IoSocketHandleImpl::close() {
  if (!isOpen()) {
    return IoVoidResult::success();
  }

  int result = ::close(fd_);
  fd_ = INVALID_SOCKET_FD;

  if (result != 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

}  // namespace network
}  // namespace canal
