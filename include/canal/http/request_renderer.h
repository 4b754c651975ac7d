#ifndef CANAL_HTTP_REQUEST_RENDERER_H
#define CANAL_HTTP_REQUEST_RENDERER_H

#include <string>
#include <vector>

#include "canal/http/http_types.h"

namespace canal {
namespace http {

/**
 * Serializes requests into wire buffers.
 *
 * The renderer owns the Host, User-Agent and Content-Length headers;
 * callers supply everything else.
 */
class RequestRenderer {
 public:
  explicit RequestRenderer(std::string user_agent_header = std::string());

  /**
   * Check that a request can be rendered.
   * @return empty string when valid, otherwise the reason it is not
   */
  std::string verify(const HttpRequest& request) const;

  /**
   * Render the request. The first buffer holds the request line and
   * headers, a second one the body if there is any.
   */
  std::vector<std::string> render(const HttpRequest& request,
                                  const std::string& host,
                                  uint16_t port) const;

  const std::string& userAgentHeader() const { return user_agent_header_; }

 private:
  std::string user_agent_header_;
};

}  // namespace http
}  // namespace canal

#endif  // CANAL_HTTP_REQUEST_RENDERER_H
