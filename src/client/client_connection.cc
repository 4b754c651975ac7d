#define CANAL_LOG_COMPONENT "client.connection"

#include "canal/client/client_connection.h"

#include <algorithm>

#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

namespace {

// Upper bound of slices handed to a single writev
constexpr size_t kMaxWriteSlices = 16;

const uint32_t kReadEvent = static_cast<uint32_t>(event::FileReadyType::Read);
const uint32_t kWriteEvent =
    static_cast<uint32_t>(event::FileReadyType::Write);

}  // namespace

ClientConnection::ClientConnection(uint64_t id,
                                   const std::string& host,
                                   uint16_t port,
                                   ConnectionIoPtr io,
                                   ClientConnectionCallbacks& callbacks,
                                   OpenRequestRegistry& registry,
                                   const http::ParserLimits& limits,
                                   size_t read_buffer_size,
                                   TimeSource time_source)
    : id_(id),
      host_(host),
      port_(port),
      io_(std::move(io)),
      callbacks_(callbacks),
      registry_(registry),
      time_source_(std::move(time_source)),
      read_buffer_(std::max<size_t>(read_buffer_size, 1)) {
  parser_ = http::createResponseParser(*this, limits);
  parser_->expectNoResponse();
  touch();
}

ClientConnection::~ClientConnection() {
  // Owners close connections before releasing them; only the socket is left
  if (io_) {
    io_->close();
  }
}

void ClientConnection::initialize(bool connecting) {
  connecting_ = connecting;
  established_ = !connecting;
  uint32_t events = connecting ? kWriteEvent : kReadEvent;
  io_->initialize([this](uint32_t ready) { onIoReady(ready); }, events);
  CANAL_CONN_LOG(Debug, id_, "Initialized for {}:{} (connecting={})", host_,
                 port_, connecting);
}

void ClientConnection::acceptSend(QueuedSend&& send) {
  if (closed_) {
    deliverSafely(*send.sink, HttpClientException(errors::kClosedConnection));
    return;
  }

  if (!write_buffers_.empty()) {
    CANAL_CONN_LOG(Debug, id_, "Queueing {} {} behind current write",
                   http::httpMethodToString(send.request->method),
                   send.request->uri);
    queued_sends_.push_back(std::move(send));
    return;
  }

  startWriting(std::move(send));
}

void ClientConnection::startWriting(QueuedSend&& send) {
  for (auto& buffer : send.buffers) {
    if (!buffer.empty()) {
      write_buffers_.push_back(std::move(buffer));
    }
  }
  write_offset_ = 0;

  PendingResponse pending;
  pending.request = send.request;
  pending.sink = std::move(send.sink);
  pending.record = registry_.append(send.request, this, time_source_());
  pending_.push_back(std::move(pending));

  CANAL_CONN_LOG(Debug, id_, "Writing {} {} ({} pending)",
                 http::httpMethodToString(send.request->method),
                 send.request->uri, pending_.size());

  if (write_buffers_.empty()) {
    onWriteDrained();
    return;
  }
  enableWriting();
}

void ClientConnection::onIoReady(uint32_t events) {
  if (closed_) {
    return;
  }

  if (events & kWriteEvent) {
    if (connecting_) {
      onConnectComplete();
    } else {
      flushWriteBuffers();
    }
  }

  if (!closed_ && !connecting_ && (events & kReadEvent)) {
    onReadReady();
  }
}

void ClientConnection::onConnectComplete() {
  connecting_ = false;

  auto result = io_->socketError();
  if (!result.ok()) {
    std::string reason = result.error_message();
    callbacks_.onConnectFailed(*this, reason);
    closeWithError(reason);
    return;
  }

  CANAL_CONN_LOG(Debug, id_, "Established to {}:{}", host_, port_);
  established_ = true;
  touch();
  updateInterest();
  callbacks_.onConnected(*this);
}

void ClientConnection::flushWriteBuffers() {
  network::ConstRawSlice slices[kMaxWriteSlices];

  while (!closed_ && !write_buffers_.empty()) {
    size_t num_slices = 0;
    for (const auto& buffer : write_buffers_) {
      if (num_slices == kMaxWriteSlices) {
        break;
      }
      size_t offset = num_slices == 0 ? write_offset_ : 0;
      slices[num_slices].mem_ = buffer.data() + offset;
      slices[num_slices].len_ = buffer.size() - offset;
      ++num_slices;
    }

    auto result = io_->writev(slices, num_slices);
    if (!result.ok()) {
      if (result.wouldBlock()) {
        return;
      }
      closeWithError("Connection error: " + result.error_message());
      return;
    }
    touch();

    // Consume what was written
    size_t written = *result;
    while (written > 0 && !write_buffers_.empty()) {
      size_t remaining = write_buffers_.front().size() - write_offset_;
      if (written < remaining) {
        write_offset_ += written;
        written = 0;
      } else {
        written -= remaining;
        write_buffers_.pop_front();
        write_offset_ = 0;
      }
    }

    if (write_buffers_.empty()) {
      onWriteDrained();
    }
  }
}

void ClientConnection::onWriteDrained() {
  // The request is on the wire; prime the parser for its response
  if (holds_alternative<AwaitingResponse>(parser_state_) &&
      !pending_.empty()) {
    setParserState(ParsingComplete{pending_.front().request->method});
  }

  if (!queued_sends_.empty()) {
    QueuedSend next = std::move(queued_sends_.front());
    queued_sends_.pop_front();
    startWriting(std::move(next));
  } else {
    disableWriting();
  }
}

void ClientConnection::onReadReady() {
  while (!closed_) {
    auto result = io_->read(read_buffer_.data(), read_buffer_.size());
    if (!result.ok()) {
      if (result.wouldBlock()) {
        return;
      }
      closeWithError("Connection error: " + result.error_message());
      return;
    }

    if (*result == 0) {
      onEndOfStream();
      return;
    }

    touch();
    parser_->execute(read_buffer_.data(), *result);
  }
}

void ClientConnection::onEndOfStream() {
  CANAL_CONN_LOG(Debug, id_, "Server closed the stream ({} pending)",
                 pending_.size());

  // Completes a response delimited by the connection close
  parser_->finish();
  closeWithError(errors::kServerClosed);
}

void ClientConnection::resetParserAfterDelivery() {
  if (closed_) {
    return;
  }
  if (pending_.empty()) {
    setParserState(AwaitingResponse{});
  } else {
    setParserState(ParsingComplete{pending_.front().request->method});
  }
}

void ClientConnection::setParserState(ParserState state) {
  parser_state_ = std::move(state);

  if (holds_alternative<AwaitingResponse>(parser_state_)) {
    parser_->expectNoResponse();
  } else if (auto* complete = get_if<ParsingComplete>(&parser_state_)) {
    parser_->expectResponseTo(complete->method);
  }
}

void ClientConnection::onCompleteMessage(http::HttpResponse&& response) {
  if (closed_) {
    return;
  }
  if (pending_.empty()) {
    onParseError(errors::kUnexpectedResponse);
    return;
  }

  CANAL_CONN_LOG(Debug, id_, "Response {} for {}", response.statusCode(),
                 pending_.front().request->uri);
  completeHead(std::move(response));
  resetParserAfterDelivery();
}

void ClientConnection::onChunkedStart(http::ChunkedResponseStart&& start) {
  if (closed_) {
    return;
  }
  if (pending_.empty()) {
    onParseError(errors::kUnexpectedResponse);
    return;
  }

  setParserState(ChunkStreaming{});
  deliverToHead(std::move(start));
}

void ClientConnection::onChunk(http::MessageChunk&& chunk) {
  if (closed_ || pending_.empty()) {
    return;
  }
  deliverToHead(std::move(chunk));
}

void ClientConnection::onChunkedEnd(http::ChunkedResponseEnd&& end) {
  if (closed_ || pending_.empty()) {
    return;
  }
  completeHead(std::move(end));
  resetParserAfterDelivery();
}

void ClientConnection::onParseError(const std::string& message) {
  if (closed_) {
    return;
  }
  setParserState(ParserFailed{message});
  callbacks_.onIllegalResponse(*this, message);
  closeWithError(message);
}

void ClientConnection::deliverToHead(ResponseEvent&& event) {
  deliverSafely(*pending_.front().sink, std::move(event));
}

void ClientConnection::completeHead(ResponseEvent&& event) {
  PendingResponse head = std::move(pending_.front());
  pending_.pop_front();
  registry_.remove(head.record);
  deliverSafely(*head.sink, std::move(event));
}

void ClientConnection::closeAllPendingWithError(const std::string& message) {
  while (!pending_.empty()) {
    completeHead(HttpClientException(message));
  }

  // Sends that never reached the wire fail after the written ones
  while (!queued_sends_.empty()) {
    QueuedSend send = std::move(queued_sends_.front());
    queued_sends_.pop_front();
    deliverSafely(*send.sink, HttpClientException(message));
  }
}

void ClientConnection::closeWithError(const std::string& message) {
  if (closed_) {
    return;
  }
  closed_ = true;

  CANAL_CONN_LOG(Debug, id_, "Closing to {}:{}: {} ({} pending)", host_,
                 port_, message, pending_.size() + queued_sends_.size());

  closeAllPendingWithError(message);
  write_buffers_.clear();
  write_offset_ = 0;
  io_->close();

  callbacks_.onClosed(*this, message);
}

void ClientConnection::enableWriting() {
  if (!write_enabled_) {
    write_enabled_ = true;
    updateInterest();
  }
}

void ClientConnection::disableWriting() {
  if (write_enabled_) {
    write_enabled_ = false;
    updateInterest();
  }
}

void ClientConnection::updateInterest() {
  if (closed_ || connecting_) {
    return;
  }
  io_->setInterest(kReadEvent | (write_enabled_ ? kWriteEvent : 0));
}

void ClientConnection::touch() { last_activity_ = time_source_(); }

}  // namespace client
}  // namespace canal
