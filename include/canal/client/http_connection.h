#ifndef CANAL_CLIENT_HTTP_CONNECTION_H
#define CANAL_CLIENT_HTTP_CONNECTION_H

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "canal/client/response_sink.h"
#include "canal/http/http_types.h"

namespace canal {
namespace client {

class HttpClient;

/**
 * Caller-side handle of an established connection.
 *
 * All methods are thread-safe and return without waiting for the network.
 * The handle must not outlive the HttpClient that created it.
 */
class HttpConnection {
 public:
  HttpConnection(HttpClient& client,
                 uint64_t id,
                 std::string host,
                 uint16_t port);

  /**
   * Send a request and wait for its response through the future. The
   * future fails with HttpClientException on any error, including a
   * chunked response.
   */
  std::future<http::HttpResponse> send(const http::HttpRequest& request);

  /**
   * Send a request and forward every event of its response to receiver,
   * together with context when one was given.
   */
  void send(const http::HttpRequest& request,
            ResponseReceiverSharedPtr receiver,
            optional<RequestContext> context = nullopt);

  /**
   * Request teardown of the connection. Pending requests fail with
   * "Connection closed" once the dispatcher handles the close.
   */
  void close();

  /**
   * Streaming request bodies are not implemented.
   * @throws HttpClientException always
   */
  void startRequestStream(const http::ChunkedRequestStart& start);

  uint64_t id() const { return id_; }
  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

 private:
  void submit(const http::HttpRequest& request, ResponseSinkPtr sink);

  HttpClient& client_;
  const uint64_t id_;
  const std::string host_;
  const uint16_t port_;
};

using HttpConnectionSharedPtr = std::shared_ptr<HttpConnection>;

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_HTTP_CONNECTION_H
