#include "canal/http/request_renderer.h"

namespace canal {
namespace http {

namespace {

bool containsLineBreak(const std::string& value) {
  return value.find_first_of("\r\n") != std::string::npos;
}

// RFC 7230 token characters
bool isTokenChar(char c) {
  if (c >= 'a' && c <= 'z') return true;
  if (c >= 'A' && c <= 'Z') return true;
  if (c >= '0' && c <= '9') return true;
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

bool isToken(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (char c : value) {
    if (!isTokenChar(c)) {
      return false;
    }
  }
  return true;
}

bool methodExpectsBody(HttpMethod method) {
  return method == HttpMethod::POST || method == HttpMethod::PUT ||
         method == HttpMethod::PATCH;
}

}  // namespace

RequestRenderer::RequestRenderer(std::string user_agent_header)
    : user_agent_header_(std::move(user_agent_header)) {}

std::string RequestRenderer::verify(const HttpRequest& request) const {
  if (request.method == HttpMethod::UNKNOWN) {
    return "unsupported request method";
  }
  if (request.uri.empty()) {
    return "request URI must not be empty";
  }
  if (request.uri.find_first_of(" \t\r\n") != std::string::npos) {
    return "request URI must not contain whitespace";
  }
  bool absolute = request.uri.compare(0, 7, "http://") == 0 ||
                  request.uri.compare(0, 8, "https://") == 0;
  bool asterisk = request.uri == "*" && request.method == HttpMethod::OPTIONS;
  if (request.uri[0] != '/' && !absolute && !asterisk) {
    return "request URI must be absolute or start with '/'";
  }

  for (const auto& header : request.headers) {
    if (!isToken(header.first)) {
      return "illegal header name '" + header.first + "'";
    }
    if (containsLineBreak(header.second)) {
      return "header '" + header.first + "' must not contain line breaks";
    }
    if (equalsIgnoreCase(header.first, "Content-Length")) {
      return "Content-Length header must not be set explicitly, use the "
             "request body instead";
    }
    if (equalsIgnoreCase(header.first, "Transfer-Encoding")) {
      return "Transfer-Encoding header must not be set explicitly";
    }
    if (equalsIgnoreCase(header.first, "Host")) {
      return "Host header must not be set explicitly, it is derived from "
             "the connection";
    }
  }
  return std::string();
}

std::vector<std::string> RequestRenderer::render(const HttpRequest& request,
                                                 const std::string& host,
                                                 uint16_t port) const {
  std::string head;
  head.reserve(128 + request.uri.size() + request.headers.byteSize());

  head.append(httpMethodToString(request.method));
  head.push_back(' ');
  head.append(request.uri);
  head.push_back(' ');
  head.append(httpVersionToString(request.version));
  head.append("\r\n");

  head.append("Host: ");
  // IPv6 literals are bracketed so the port separator stays unambiguous
  bool ipv6_literal =
      host.find(':') != std::string::npos && host.front() != '[';
  if (ipv6_literal) {
    head.push_back('[');
  }
  head.append(host);
  if (ipv6_literal) {
    head.push_back(']');
  }
  if (port != 80) {
    head.push_back(':');
    head.append(std::to_string(port));
  }
  head.append("\r\n");

  for (const auto& header : request.headers) {
    head.append(header.first);
    head.append(": ");
    head.append(header.second);
    head.append("\r\n");
  }

  if (!user_agent_header_.empty() && !request.headers.has("User-Agent")) {
    head.append("User-Agent: ");
    head.append(user_agent_header_);
    head.append("\r\n");
  }

  if (!request.body.empty() || methodExpectsBody(request.method)) {
    head.append("Content-Length: ");
    head.append(std::to_string(request.body.size()));
    head.append("\r\n");
  }
  head.append("\r\n");

  std::vector<std::string> buffers;
  buffers.push_back(std::move(head));
  if (!request.body.empty()) {
    buffers.push_back(request.body);
  }
  return buffers;
}

}  // namespace http
}  // namespace canal
