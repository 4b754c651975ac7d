#ifndef CANAL_CLIENT_RESPONSE_SINK_H
#define CANAL_CLIENT_RESPONSE_SINK_H

#include <future>
#include <memory>

#include "canal/client/delivery_executor.h"
#include "canal/client/http_client_exception.h"
#include "canal/core/compat.h"
#include "canal/http/http_types.h"

namespace canal {
namespace client {

/**
 * Everything that can be delivered for one request: a complete response,
 * the three parts of a chunked response, or an error.
 */
using ResponseEvent = variant<http::HttpResponse,
                              http::ChunkedResponseStart,
                              http::MessageChunk,
                              http::ChunkedResponseEnd,
                              HttpClientException>;

// True for the events after which nothing more is delivered
bool isTerminal(const ResponseEvent& event);

// Opaque value handed back with every event of a callback-style send
using RequestContext = any;

/**
 * Destination of the events of one request.
 *
 * Called on the dispatcher thread; implementations must not block.
 */
class ResponseSink {
 public:
  virtual ~ResponseSink() = default;

  virtual void deliver(ResponseEvent&& event) = 0;
};

using ResponseSinkPtr = std::unique_ptr<ResponseSink>;

/**
 * Deliver an event, logging instead of propagating anything the sink
 * throws. Used on the dispatcher thread.
 */
void deliverSafely(ResponseSink& sink, ResponseEvent&& event);

/**
 * Completes a std::future with the final response or the error.
 *
 * A chunked response fails the future; the chunks that follow are
 * discarded.
 */
class FutureResponseSink : public ResponseSink {
 public:
  FutureResponseSink() = default;

  std::future<http::HttpResponse> getFuture() { return promise_.get_future(); }

  void deliver(ResponseEvent&& event) override;

 private:
  std::promise<http::HttpResponse> promise_;
  bool completed_{false};
};

/**
 * Receives the events of callback-style sends.
 */
class ResponseReceiver {
 public:
  virtual ~ResponseReceiver() = default;

  virtual void onResponseEvent(ResponseEvent&& event,
                               const optional<RequestContext>& context) = 0;
};

using ResponseReceiverSharedPtr = std::shared_ptr<ResponseReceiver>;

/**
 * Forwards every event to a receiver, tagged with the caller's context.
 * The receiver runs on the delivery executor, never on the dispatcher.
 */
class ReceiverResponseSink : public ResponseSink {
 public:
  ReceiverResponseSink(ResponseReceiverSharedPtr receiver,
                       optional<RequestContext> context,
                       DeliveryExecutor& executor);

  void deliver(ResponseEvent&& event) override;

 private:
  ResponseReceiverSharedPtr receiver_;
  std::shared_ptr<const optional<RequestContext>> context_;
  DeliveryExecutor& executor_;
};

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_RESPONSE_SINK_H
