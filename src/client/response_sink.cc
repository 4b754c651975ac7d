#define CANAL_LOG_COMPONENT "client.sink"

#include "canal/client/response_sink.h"

#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

bool isTerminal(const ResponseEvent& event) {
  return holds_alternative<http::HttpResponse>(event) ||
         holds_alternative<http::ChunkedResponseEnd>(event) ||
         holds_alternative<HttpClientException>(event);
}

void deliverSafely(ResponseSink& sink, ResponseEvent&& event) {
  try {
    sink.deliver(std::move(event));
  } catch (const std::exception& e) {
    CANAL_LOG(Error, "Response receiver threw: {}", e.what());
  }
}

void FutureResponseSink::deliver(ResponseEvent&& event) {
  if (completed_) {
    return;
  }
  completed_ = true;

  if (auto* response = get_if<http::HttpResponse>(&event)) {
    promise_.set_value(std::move(*response));
  } else if (auto* error = get_if<HttpClientException>(&event)) {
    promise_.set_exception(std::make_exception_ptr(*error));
  } else {
    CANAL_LOG(Debug, "Rejecting chunked response for future-based send");
    promise_.set_exception(std::make_exception_ptr(
        HttpClientException(errors::kChunkedNotSupported)));
  }
}

ReceiverResponseSink::ReceiverResponseSink(ResponseReceiverSharedPtr receiver,
                                           optional<RequestContext> context,
                                           DeliveryExecutor& executor)
    : receiver_(std::move(receiver)),
      context_(std::make_shared<const optional<RequestContext>>(
          std::move(context))),
      executor_(executor) {}

void ReceiverResponseSink::deliver(ResponseEvent&& event) {
  if (!receiver_) {
    return;
  }
  auto shared = std::make_shared<ResponseEvent>(std::move(event));
  executor_.execute([receiver = receiver_, context = context_, shared]() {
    receiver->onResponseEvent(std::move(*shared), *context);
  });
}

}  // namespace client
}  // namespace canal
