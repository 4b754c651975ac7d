#define CANAL_LOG_COMPONENT "client.io"

#include "canal/client/connection_io.h"

#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

SocketConnectionIo::SocketConnectionIo(event::Dispatcher& dispatcher,
                                       network::IoHandlePtr io_handle)
    : dispatcher_(dispatcher), io_handle_(std::move(io_handle)) {}

SocketConnectionIo::~SocketConnectionIo() { close(); }

void SocketConnectionIo::initialize(ReadyCb cb, uint32_t events) {
  file_event_ =
      dispatcher_.createFileEvent(io_handle_->fd(), std::move(cb), events);
}

void SocketConnectionIo::setInterest(uint32_t events) {
  if (file_event_) {
    file_event_->setEnabled(events);
  }
}

IoCallResult SocketConnectionIo::read(char* buffer, size_t length) {
  return io_handle_->read(buffer, length);
}

IoCallResult SocketConnectionIo::writev(const network::ConstRawSlice* slices,
                                        size_t num_slices) {
  return io_handle_->writev(slices, num_slices);
}

IoVoidResult SocketConnectionIo::socketError() {
  return io_handle_->socketError();
}

void SocketConnectionIo::close() {
  if (!io_handle_->isOpen()) {
    return;
  }

  // The file event may be mid-callback; stop it but keep the object alive
  if (file_event_) {
    file_event_->setEnabled(0);
  }

  network::os_fd_t fd = io_handle_->fd();
  auto result = io_handle_->close();
  if (!result.ok()) {
    CANAL_LOG(Debug, "close() failed on fd {}: {}", fd,
              result.error_message());
  }
}

bool SocketConnectionIo::isOpen() const { return io_handle_->isOpen(); }

}  // namespace client
}  // namespace canal
