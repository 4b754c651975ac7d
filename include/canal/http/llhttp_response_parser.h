#ifndef CANAL_HTTP_LLHTTP_RESPONSE_PARSER_H
#define CANAL_HTTP_LLHTTP_RESPONSE_PARSER_H

#include <memory>

#include "canal/http/response_parser.h"

// Forward declare llhttp types to avoid including llhttp.h in header
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace canal {
namespace http {

/**
 * llhttp-based response parser.
 *
 * Thread-safety: not thread-safe, one instance per connection.
 */
class LLHttpResponseParser : public ResponseParser {
 public:
  LLHttpResponseParser(ResponseParserCallbacks& callbacks,
                       const ParserLimits& limits);
  ~LLHttpResponseParser() override;

  // ResponseParser interface
  void expectResponseTo(HttpMethod method) override;
  void expectNoResponse() override;
  size_t execute(const char* data, size_t length) override;
  void finish() override;
  bool hasError() const override { return failed_; }
  bool messageInProgress() const override { return in_message_; }

 private:
  // Static callbacks for llhttp (bridge to ResponseParserCallbacks)
  static int onMessageBegin(llhttp_t* parser);
  static int onStatus(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderField(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValue(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValueComplete(llhttp_t* parser);
  static int onHeadersComplete(llhttp_t* parser);
  static int onBody(llhttp_t* parser, const char* data, size_t length);
  static int onMessageComplete(llhttp_t* parser);
  static int onChunkExtensionName(llhttp_t* parser,
                                  const char* data,
                                  size_t length);
  static int onChunkExtensionNameComplete(llhttp_t* parser);
  static int onChunkExtensionValue(llhttp_t* parser,
                                   const char* data,
                                   size_t length);
  static int onChunkHeader(llhttp_t* parser);
  static int onChunkComplete(llhttp_t* parser);

  int fail(std::string message);
  HttpVersion currentVersion() const;
  void resetMessage();

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  ResponseParserCallbacks& callbacks_;
  const ParserLimits limits_;

  // What the next response answers
  bool expecting_{false};
  HttpMethod expected_method_{HttpMethod::GET};

  // Current message
  bool in_message_{false};
  bool chunked_{false};
  bool last_chunk_{false};
  bool in_trailer_{false};
  bool informational_{false};
  HttpStatusCode status_{HttpStatusCode::OK};
  std::string reason_;
  HttpHeaders headers_;
  HttpHeaders trailer_;
  std::string header_field_;
  std::string header_value_;
  std::string body_;
  ChunkExtensions extensions_;
  bool extension_name_open_{false};

  bool failed_{false};
  std::string error_message_;
};

}  // namespace http
}  // namespace canal

#endif  // CANAL_HTTP_LLHTTP_RESPONSE_PARSER_H
