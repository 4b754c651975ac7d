#define CANAL_LOG_COMPONENT "client.http"

#include "canal/client/http_connection.h"

#include "canal/client/http_client.h"
#include "canal/logging/log_macros.h"

namespace canal {
namespace client {

HttpConnection::HttpConnection(HttpClient& client,
                               uint64_t id,
                               std::string host,
                               uint16_t port)
    : client_(client), id_(id), host_(std::move(host)), port_(port) {}

std::future<http::HttpResponse> HttpConnection::send(
    const http::HttpRequest& request) {
  auto sink = std::make_unique<FutureResponseSink>();
  auto future = sink->getFuture();
  submit(request, std::move(sink));
  return future;
}

void HttpConnection::send(const http::HttpRequest& request,
                          ResponseReceiverSharedPtr receiver,
                          optional<RequestContext> context) {
  submit(request,
         std::make_unique<ReceiverResponseSink>(
             std::move(receiver), std::move(context), client_.delivery()));
}

void HttpConnection::close() { client_.postClose(id_); }

void HttpConnection::startRequestStream(
    const http::ChunkedRequestStart& start) {
  CANAL_LOG(Debug, "Rejected request stream for {}", start.uri);
  throw HttpClientException("Request streaming is not implemented");
}

void HttpConnection::submit(const http::HttpRequest& request,
                            ResponseSinkPtr sink) {
  auto event = std::make_unique<SendEvent>();
  event->connection_id = id_;
  event->send.request = std::make_shared<const http::HttpRequest>(request);
  event->send.sink = std::move(sink);

  // Rendering happens on the caller's thread
  const http::RequestRenderer& renderer = client_.renderer();
  std::string problem = renderer.verify(request);
  if (problem.empty()) {
    event->send.buffers = renderer.render(request, host_, port_);
  } else {
    event->rejection = "Invalid request: " + problem;
  }

  client_.postSend(std::move(event));
}

}  // namespace client
}  // namespace canal
