#ifndef CANAL_CLIENT_HTTP_CLIENT_EXCEPTION_H
#define CANAL_CLIENT_HTTP_CLIENT_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace canal {
namespace client {

/**
 * The single error kind delivered to callers of the HTTP client. Causes
 * are distinguished only by the message.
 */
class HttpClientException : public std::runtime_error {
 public:
  explicit HttpClientException(const std::string& message)
      : std::runtime_error(message) {}
};

// Messages of the connection-wide failures
namespace errors {
constexpr const char* kClosedConnection =
    "Cannot send request due to closed connection";
constexpr const char* kServerClosed = "Server closed connection";
constexpr const char* kRequestTimedOut = "Request timed out";
constexpr const char* kIdleTimeout = "Connection closed due to idle timeout";
constexpr const char* kUnexpectedResponse = "Received unexpected HttpResponse";
constexpr const char* kConnectionClosed = "Connection closed";
constexpr const char* kClientStopped = "HTTP client stopped";
constexpr const char* kChunkedNotSupported =
    "Chunked responses are not supported by future-based send";
}  // namespace errors

}  // namespace client
}  // namespace canal

#endif  // CANAL_CLIENT_HTTP_CLIENT_EXCEPTION_H
