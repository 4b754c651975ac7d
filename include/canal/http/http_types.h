#ifndef CANAL_HTTP_HTTP_TYPES_H
#define CANAL_HTTP_HTTP_TYPES_H

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "canal/core/compat.h"

namespace canal {
namespace http {

// HTTP status codes; any received code is representable via static_cast
enum class HttpStatusCode : uint16_t {
  // 1xx Informational
  Continue = 100,
  SwitchingProtocols = 101,

  // 2xx Success
  OK = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  // 3xx Redirection
  MovedPermanently = 301,
  Found = 302,
  NotModified = 304,

  // 4xx Client Error
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  RequestTimeout = 408,

  // 5xx Server Error
  InternalServerError = 500,
  NotImplemented = 501,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504
};

enum class HttpMethod {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD,
  OPTIONS,
  PATCH,
  CONNECT,
  TRACE,
  UNKNOWN
};

enum class HttpVersion { HTTP_1_0, HTTP_1_1, UNKNOWN };

const char* httpMethodToString(HttpMethod method);
HttpMethod httpMethodFromString(const std::string& method);
const char* httpVersionToString(HttpVersion version);

/**
 * HTTP headers container.
 * Maintains header order and allows case-insensitive lookups.
 */
class HttpHeaders {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  HttpHeaders() = default;
  HttpHeaders(std::initializer_list<Entry> entries);

  // Add a header (keeps existing values of the same name)
  void add(const std::string& name, const std::string& value);

  // Set a header (replaces all existing values of the same name)
  void set(const std::string& name, const std::string& value);

  void remove(const std::string& name);

  // First value for the name (case-insensitive)
  optional<std::string> get(const std::string& name) const;

  std::vector<std::string> getAll(const std::string& name) const;

  bool has(const std::string& name) const;

  void clear() { entries_.clear(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Sum of "name: value\r\n" over all entries
  size_t byteSize() const;

  void forEach(
      std::function<void(const std::string&, const std::string&)> cb) const;

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

  bool operator==(const HttpHeaders& rhs) const {
    return entries_ == rhs.entries_;
  }
  bool operator!=(const HttpHeaders& rhs) const { return !(*this == rhs); }

 private:
  std::vector<Entry> entries_;
};

bool equalsIgnoreCase(const std::string& a, const std::string& b);

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string uri{"/"};
  HttpHeaders headers;
  std::string body;
  HttpVersion version{HttpVersion::HTTP_1_1};

  HttpRequest() = default;
  HttpRequest(HttpMethod m, std::string u) : method(m), uri(std::move(u)) {}
};

struct HttpResponse {
  HttpStatusCode status{HttpStatusCode::OK};
  std::string reason;
  HttpHeaders headers;
  std::string body;
  HttpVersion version{HttpVersion::HTTP_1_1};

  uint16_t statusCode() const { return static_cast<uint16_t>(status); }
};

// "name" or "name=value" from a chunk-size line
struct ChunkExtension {
  std::string name;
  std::string value;

  bool operator==(const ChunkExtension& rhs) const {
    return name == rhs.name && value == rhs.value;
  }
};

using ChunkExtensions = std::vector<ChunkExtension>;

// Status line and headers of a response using chunked transfer encoding
struct ChunkedResponseStart {
  HttpStatusCode status{HttpStatusCode::OK};
  std::string reason;
  HttpHeaders headers;
  HttpVersion version{HttpVersion::HTTP_1_1};

  uint16_t statusCode() const { return static_cast<uint16_t>(status); }
};

struct MessageChunk {
  ChunkExtensions extensions;
  std::string body;
};

// Last chunk: its extensions plus any trailer headers
struct ChunkedResponseEnd {
  ChunkExtensions extensions;
  HttpHeaders trailer;
};

// Head of a request whose body would be streamed in chunks
struct ChunkedRequestStart {
  HttpMethod method{HttpMethod::POST};
  std::string uri{"/"};
  HttpHeaders headers;
  HttpVersion version{HttpVersion::HTTP_1_1};
};

}  // namespace http
}  // namespace canal

#endif  // CANAL_HTTP_HTTP_TYPES_H
