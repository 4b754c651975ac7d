#define CANAL_LOG_COMPONENT "http.parser"

#include "canal/http/llhttp_response_parser.h"

#include <llhttp.h>

#include "canal/logging/log_macros.h"

namespace canal {
namespace http {

LLHttpResponseParser::LLHttpResponseParser(ResponseParserCallbacks& callbacks,
                                           const ParserLimits& limits)
    : callbacks_(callbacks), limits_(limits) {
  parser_ = std::make_unique<llhttp_t>();
  settings_ = std::make_unique<llhttp_settings_t>();

  llhttp_settings_init(settings_.get());

  // All callbacks reach this instance through parser->data
  settings_->on_message_begin = &LLHttpResponseParser::onMessageBegin;
  settings_->on_status = &LLHttpResponseParser::onStatus;
  settings_->on_header_field = &LLHttpResponseParser::onHeaderField;
  settings_->on_header_value = &LLHttpResponseParser::onHeaderValue;
  settings_->on_header_value_complete =
      &LLHttpResponseParser::onHeaderValueComplete;
  settings_->on_headers_complete = &LLHttpResponseParser::onHeadersComplete;
  settings_->on_body = &LLHttpResponseParser::onBody;
  settings_->on_message_complete = &LLHttpResponseParser::onMessageComplete;
  settings_->on_chunk_extension_name =
      &LLHttpResponseParser::onChunkExtensionName;
  settings_->on_chunk_extension_name_complete =
      &LLHttpResponseParser::onChunkExtensionNameComplete;
  settings_->on_chunk_extension_value =
      &LLHttpResponseParser::onChunkExtensionValue;
  settings_->on_chunk_header = &LLHttpResponseParser::onChunkHeader;
  settings_->on_chunk_complete = &LLHttpResponseParser::onChunkComplete;

  llhttp_init(parser_.get(), HTTP_RESPONSE, settings_.get());
  parser_->data = this;
}

LLHttpResponseParser::~LLHttpResponseParser() = default;

void LLHttpResponseParser::expectResponseTo(HttpMethod method) {
  expecting_ = true;
  expected_method_ = method;
}

void LLHttpResponseParser::expectNoResponse() { expecting_ = false; }

size_t LLHttpResponseParser::execute(const char* data, size_t length) {
  if (failed_ || length == 0) {
    return 0;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);
  if (err == HPE_OK) {
    return length;
  }

  size_t consumed = length;
  const char* pos = llhttp_get_error_pos(parser_.get());
  if (pos != nullptr && pos >= data && pos <= data + length) {
    consumed = static_cast<size_t>(pos - data);
  }

  std::string message;
  if (!error_message_.empty()) {
    message = error_message_;
  } else if (err == HPE_PAUSED_UPGRADE) {
    message = "Protocol upgrade responses are not supported";
  } else {
    const char* reason = llhttp_get_error_reason(parser_.get());
    message = std::string("Illegal HTTP response: ") +
              (reason ? reason : llhttp_errno_name(err));
  }

  failed_ = true;
  in_message_ = false;
  CANAL_LOG(Debug, "Response parsing failed ({}): {}", llhttp_errno_name(err),
            message);
  callbacks_.onParseError(message);
  return consumed;
}

void LLHttpResponseParser::finish() {
  if (failed_) {
    return;
  }

  llhttp_errno_t err = llhttp_finish(parser_.get());
  if (err != HPE_OK) {
    CANAL_LOG(Debug, "Stream ended inside a response: {}",
              llhttp_errno_name(err));
  }
  in_message_ = false;
}

int LLHttpResponseParser::fail(std::string message) {
  error_message_ = std::move(message);
  llhttp_set_error_reason(parser_.get(), error_message_.c_str());
  return HPE_USER;
}

HttpVersion LLHttpResponseParser::currentVersion() const {
  if (parser_->http_major == 1 && parser_->http_minor == 0) {
    return HttpVersion::HTTP_1_0;
  }
  if (parser_->http_major == 1 && parser_->http_minor == 1) {
    return HttpVersion::HTTP_1_1;
  }
  return HttpVersion::UNKNOWN;
}

void LLHttpResponseParser::resetMessage() {
  chunked_ = false;
  last_chunk_ = false;
  in_trailer_ = false;
  informational_ = false;
  status_ = HttpStatusCode::OK;
  reason_.clear();
  headers_.clear();
  trailer_.clear();
  header_field_.clear();
  header_value_.clear();
  body_.clear();
  extensions_.clear();
  extension_name_open_ = false;
}

int LLHttpResponseParser::onMessageBegin(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (!self->expecting_) {
    return self->fail("Received unexpected HttpResponse");
  }
  self->resetMessage();
  self->in_message_ = true;
  return 0;
}

int LLHttpResponseParser::onStatus(llhttp_t* parser,
                                   const char* data,
                                   size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  self->reason_.append(data, length);
  return 0;
}

int LLHttpResponseParser::onHeaderField(llhttp_t* parser,
                                        const char* data,
                                        size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (self->header_field_.size() + length >
      self->limits_.max_header_name_length) {
    return self->fail("HTTP header name exceeds the configured limit of " +
                      std::to_string(self->limits_.max_header_name_length) +
                      " characters");
  }
  self->header_field_.append(data, length);
  return 0;
}

int LLHttpResponseParser::onHeaderValue(llhttp_t* parser,
                                        const char* data,
                                        size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (self->header_value_.size() + length >
      self->limits_.max_header_value_length) {
    return self->fail("HTTP header value exceeds the configured limit of " +
                      std::to_string(self->limits_.max_header_value_length) +
                      " characters");
  }
  self->header_value_.append(data, length);
  return 0;
}

int LLHttpResponseParser::onHeaderValueComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  HttpHeaders& target = self->in_trailer_ ? self->trailer_ : self->headers_;
  if (target.size() >= self->limits_.max_header_count) {
    return self->fail("HTTP message has more than " +
                      std::to_string(self->limits_.max_header_count) +
                      " headers");
  }
  target.add(self->header_field_, self->header_value_);
  self->header_field_.clear();
  self->header_value_.clear();
  return 0;
}

int LLHttpResponseParser::onHeadersComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (self->in_trailer_) {
    return 0;
  }

  uint16_t code = static_cast<uint16_t>(parser->status_code);
  self->status_ = static_cast<HttpStatusCode>(code);

  if (code == 101) {
    return self->fail("Protocol upgrade responses are not supported");
  }

  // Interim responses precede the real one and are dropped
  if (code >= 100 && code < 200) {
    self->informational_ = true;
    return 0;
  }

  if (self->expected_method_ == HttpMethod::HEAD) {
    return 1;  // No body regardless of the framing headers
  }

  if (parser->flags & F_CHUNKED) {
    self->chunked_ = true;
    ChunkedResponseStart start;
    start.status = self->status_;
    start.reason = self->reason_;
    start.headers = self->headers_;
    start.version = self->currentVersion();
    self->callbacks_.onChunkedStart(std::move(start));
    return 0;
  }

  if ((parser->flags & F_CONTENT_LENGTH) &&
      parser->content_length > self->limits_.max_content_length) {
    return self->fail("HTTP response Content-Length " +
                      std::to_string(parser->content_length) +
                      " exceeds the configured limit of " +
                      std::to_string(self->limits_.max_content_length));
  }
  return 0;
}

int LLHttpResponseParser::onBody(llhttp_t* parser,
                                 const char* data,
                                 size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (!self->chunked_ &&
      self->body_.size() + length > self->limits_.max_content_length) {
    return self->fail("HTTP response entity exceeds the configured limit of " +
                      std::to_string(self->limits_.max_content_length) +
                      " bytes");
  }
  self->body_.append(data, length);
  return 0;
}

int LLHttpResponseParser::onChunkExtensionName(llhttp_t* parser,
                                               const char* data,
                                               size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (!self->extension_name_open_) {
    self->extensions_.emplace_back();
    self->extension_name_open_ = true;
  }
  self->extensions_.back().name.append(data, length);
  return 0;
}

int LLHttpResponseParser::onChunkExtensionNameComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  self->extension_name_open_ = false;
  return 0;
}

int LLHttpResponseParser::onChunkExtensionValue(llhttp_t* parser,
                                                const char* data,
                                                size_t length) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (self->extensions_.empty()) {
    self->extensions_.emplace_back();
  }
  self->extensions_.back().value.append(data, length);
  return 0;
}

int LLHttpResponseParser::onChunkHeader(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  uint64_t size = parser->content_length;

  if (size == 0) {
    // Last chunk; trailer headers follow
    self->last_chunk_ = true;
    self->in_trailer_ = true;
    return 0;
  }

  if (size > self->limits_.max_chunk_size) {
    return self->fail("HTTP chunk size " + std::to_string(size) +
                      " exceeds the configured limit of " +
                      std::to_string(self->limits_.max_chunk_size));
  }
  return 0;
}

int LLHttpResponseParser::onChunkComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  if (self->last_chunk_) {
    return 0;  // Reported with the end of the message
  }

  MessageChunk chunk;
  chunk.extensions = std::move(self->extensions_);
  chunk.body = std::move(self->body_);
  self->extensions_.clear();
  self->body_.clear();
  self->extension_name_open_ = false;

  self->callbacks_.onChunk(std::move(chunk));
  return 0;
}

int LLHttpResponseParser::onMessageComplete(llhttp_t* parser) {
  auto* self = static_cast<LLHttpResponseParser*>(parser->data);
  self->in_message_ = false;

  if (self->informational_) {
    self->resetMessage();
    return 0;
  }

  if (self->chunked_) {
    ChunkedResponseEnd end;
    end.extensions = std::move(self->extensions_);
    end.trailer = std::move(self->trailer_);
    self->resetMessage();
    self->callbacks_.onChunkedEnd(std::move(end));
    return 0;
  }

  HttpResponse response;
  response.status = self->status_;
  response.reason = std::move(self->reason_);
  response.headers = std::move(self->headers_);
  response.body = std::move(self->body_);
  response.version = self->currentVersion();
  self->resetMessage();
  self->callbacks_.onCompleteMessage(std::move(response));
  return 0;
}

ResponseParserPtr createResponseParser(ResponseParserCallbacks& callbacks,
                                       const ParserLimits& limits) {
  return std::make_unique<LLHttpResponseParser>(callbacks, limits);
}

}  // namespace http
}  // namespace canal
