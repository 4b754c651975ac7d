#ifndef CANAL_CLIENT_CLIENT_CONNECTION_H
#define CANAL_CLIENT_CLIENT_CONNECTION_H

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "canal/client/connection_io.h"
#include "canal/client/open_request_registry.h"
#include "canal/client/response_sink.h"
#include "canal/core/compat.h"
#include "canal/event/event_loop.h"
#include "canal/http/response_parser.h"

namespace canal {
namespace client {

class ClientConnection;

// Parser states of a connection
struct AwaitingResponse {};
struct ParsingComplete {
  http::HttpMethod method;
};
struct ChunkStreaming {};
struct ParserFailed {
  std::string message;
};

using ParserState =
    variant<AwaitingResponse, ParsingComplete, ChunkStreaming, ParserFailed>;

/**
 * A request with its serialized bytes, waiting for the connection to be
 * free to write.
 */
struct QueuedSend {
  std::shared_ptr<const http::HttpRequest> request;
  std::vector<std::string> buffers;
  ResponseSinkPtr sink;
};

// Slot for the response of one request that has been accepted for writing
struct PendingResponse {
  std::shared_ptr<const http::HttpRequest> request;
  ResponseSinkPtr sink;
  OpenRequestRegistry::Handle record;
};

/**
 * Lifecycle notifications from a connection to its owner.
 */
class ClientConnectionCallbacks {
 public:
  virtual ~ClientConnectionCallbacks() = default;

  // A connect that was in progress completed
  virtual void onConnected(ClientConnection& connection) = 0;

  // A connect that was in progress failed; onClosed follows
  virtual void onConnectFailed(ClientConnection& connection,
                               const std::string& reason) = 0;

  /**
   * The connection is closed and all its pending work was failed with
   * reason. The owner should hand the connection to deferredDelete.
   */
  virtual void onClosed(ClientConnection& connection,
                        const std::string& reason) = 0;

  // The response stream was rejected by the parser
  virtual void onIllegalResponse(ClientConnection& connection,
                                 const std::string& message) = 0;
};

/**
 * One pipelining HTTP/1.1 connection.
 *
 * Requests are written strictly one after the other. Responses are matched
 * to the oldest pending request, and every request gets exactly one
 * terminal delivery. All methods must run on the dispatcher thread.
 */
class ClientConnection : public http::ResponseParserCallbacks,
                         public event::DeferredDeletable {
 public:
  ClientConnection(uint64_t id,
                   const std::string& host,
                   uint16_t port,
                   ConnectionIoPtr io,
                   ClientConnectionCallbacks& callbacks,
                   OpenRequestRegistry& registry,
                   const http::ParserLimits& limits,
                   size_t read_buffer_size,
                   TimeSource time_source);
  ~ClientConnection() override;

  /**
   * Start watching the socket. When connecting, completion of the connect
   * is reported through onConnected/onConnectFailed.
   */
  void initialize(bool connecting);

  /**
   * Write the send now if nothing is being written, otherwise queue it
   * behind the sends already waiting.
   */
  void acceptSend(QueuedSend&& send);

  /**
   * Fail all pending requests and queued sends with message, close the
   * socket and notify the owner. No-op when already closed.
   */
  void closeWithError(const std::string& message);

  // Readiness notification from the ConnectionIo
  void onIoReady(uint32_t events);

  uint64_t id() const { return id_; }
  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

  bool connecting() const { return connecting_; }
  // True once the connect completed, also after a later close
  bool established() const { return established_; }
  bool closed() const { return closed_; }
  MonotonicTime lastActivity() const { return last_activity_; }

  const ParserState& parserState() const { return parser_state_; }
  size_t pendingCount() const { return pending_.size(); }
  size_t queuedSendCount() const { return queued_sends_.size(); }
  size_t writeBufferCount() const { return write_buffers_.size(); }

  // ResponseParserCallbacks
  void onCompleteMessage(http::HttpResponse&& response) override;
  void onChunkedStart(http::ChunkedResponseStart&& start) override;
  void onChunk(http::MessageChunk&& chunk) override;
  void onChunkedEnd(http::ChunkedResponseEnd&& end) override;
  void onParseError(const std::string& message) override;

 private:
  void startWriting(QueuedSend&& send);
  void flushWriteBuffers();
  void onWriteDrained();
  void onReadReady();
  void onEndOfStream();
  void onConnectComplete();

  void resetParserAfterDelivery();
  void closeAllPendingWithError(const std::string& message);
  void setParserState(ParserState state);

  void deliverToHead(ResponseEvent&& event);
  // Pops the head slot and delivers its terminal event
  void completeHead(ResponseEvent&& event);

  void enableWriting();
  void disableWriting();
  void updateInterest();
  void touch();

  const uint64_t id_;
  const std::string host_;
  const uint16_t port_;

  ConnectionIoPtr io_;
  ClientConnectionCallbacks& callbacks_;
  OpenRequestRegistry& registry_;
  TimeSource time_source_;
  http::ResponseParserPtr parser_;
  ParserState parser_state_{AwaitingResponse{}};

  // Buffers of the send being written; front is partially written
  std::deque<std::string> write_buffers_;
  size_t write_offset_{0};
  std::deque<QueuedSend> queued_sends_;
  std::deque<PendingResponse> pending_;

  std::vector<char> read_buffer_;
  bool connecting_{false};
  bool established_{false};
  bool closed_{false};
  bool write_enabled_{false};
  MonotonicTime last_activity_;
};

using ClientConnectionPtr = std::unique_ptr<ClientConnection>;

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_CLIENT_CONNECTION_H
