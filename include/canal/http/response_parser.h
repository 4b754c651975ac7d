#ifndef CANAL_HTTP_RESPONSE_PARSER_H
#define CANAL_HTTP_RESPONSE_PARSER_H

#include <cstddef>
#include <memory>
#include <string>

#include "canal/http/http_types.h"

namespace canal {
namespace http {

// Upper bounds enforced while parsing; a violation is a parse error
struct ParserLimits {
  size_t max_header_count = 64;
  size_t max_header_name_length = 64;
  size_t max_header_value_length = 8192;
  size_t max_content_length = 8 * 1024 * 1024;
  size_t max_chunk_size = 1024 * 1024;
};

/**
 * Receives the messages recognized by a ResponseParser.
 *
 * For a chunked response the order is onChunkedStart, any number of
 * onChunk, then onChunkedEnd. Callbacks may call back into the parser's
 * expectResponseTo()/expectNoResponse() to prime it for the next response.
 */
class ResponseParserCallbacks {
 public:
  virtual ~ResponseParserCallbacks() = default;

  virtual void onCompleteMessage(HttpResponse&& response) = 0;
  virtual void onChunkedStart(ChunkedResponseStart&& start) = 0;
  virtual void onChunk(MessageChunk&& chunk) = 0;
  virtual void onChunkedEnd(ChunkedResponseEnd&& end) = 0;

  // Reported at most once; the parser ignores all input afterwards
  virtual void onParseError(const std::string& message) = 0;
};

/**
 * Incremental HTTP/1.x response parser for one connection.
 */
class ResponseParser {
 public:
  virtual ~ResponseParser() = default;

  /**
   * The next response answers a request with this method. Responses to
   * HEAD never carry a body.
   */
  virtual void expectResponseTo(HttpMethod method) = 0;

  /**
   * No request is outstanding; the start of a response is an error.
   */
  virtual void expectNoResponse() = 0;

  /**
   * Feed received bytes.
   * @return number of bytes consumed; less than length only on error
   */
  virtual size_t execute(const char* data, size_t length) = 0;

  /**
   * The peer closed the stream. Completes a response delimited by
   * connection close. Incomplete messages are not reported as errors.
   */
  virtual void finish() = 0;

  virtual bool hasError() const = 0;

  // True between the first byte of a response and its completion
  virtual bool messageInProgress() const = 0;
};

using ResponseParserPtr = std::unique_ptr<ResponseParser>;

/**
 * Create the default (llhttp) parser.
 */
ResponseParserPtr createResponseParser(ResponseParserCallbacks& callbacks,
                                       const ParserLimits& limits);

}  // namespace http
}  // namespace canal

#endif  // CANAL_HTTP_RESPONSE_PARSER_H
