#ifndef CANAL_CLIENT_CONNECTION_IO_H
#define CANAL_CLIENT_CONNECTION_IO_H

#include <cstdint>
#include <functional>
#include <memory>

#include "canal/event/event_loop.h"
#include "canal/io_result.h"
#include "canal/network/io_handle.h"

namespace canal {
namespace client {

/**
 * Socket side of a client connection: readiness notifications plus the
 * non-blocking read/write/close primitives.
 */
class ConnectionIo {
 public:
  using ReadyCb = std::function<void(uint32_t events)>;

  virtual ~ConnectionIo() = default;

  /**
   * Start watching the socket for the given FileReadyType mask.
   */
  virtual void initialize(ReadyCb cb, uint32_t events) = 0;

  // Replace the watched FileReadyType mask
  virtual void setInterest(uint32_t events) = 0;

  virtual IoCallResult read(char* buffer, size_t length) = 0;
  virtual IoCallResult writev(const network::ConstRawSlice* slices,
                              size_t num_slices) = 0;

  // Outcome of a non-blocking connect
  virtual IoVoidResult socketError() = 0;

  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

using ConnectionIoPtr = std::unique_ptr<ConnectionIo>;

/**
 * ConnectionIo over an IoHandle, driven by a dispatcher file event.
 */
class SocketConnectionIo : public ConnectionIo {
 public:
  SocketConnectionIo(event::Dispatcher& dispatcher,
                     network::IoHandlePtr io_handle);
  ~SocketConnectionIo() override;

  void initialize(ReadyCb cb, uint32_t events) override;
  void setInterest(uint32_t events) override;
  IoCallResult read(char* buffer, size_t length) override;
  IoCallResult writev(const network::ConstRawSlice* slices,
                      size_t num_slices) override;
  IoVoidResult socketError() override;
  void close() override;
  bool isOpen() const override;

 private:
  event::Dispatcher& dispatcher_;
  network::IoHandlePtr io_handle_;
  event::FileEventPtr file_event_;
};

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_CONNECTION_IO_H
