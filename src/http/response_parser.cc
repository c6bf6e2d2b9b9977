#include "conduit/http/response_parser.h"

#include "conduit/http/llhttp_parser.h"

#define CONDUIT_LOG_COMPONENT "Parser"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

ResponseParser::ResponseParser()
    : parser_(createLLHttpParser(HttpParserType::RESPONSE, this)) {}

ResponseParser::~ResponseParser() = default;

Result<size_t> ResponseParser::execute(const char* data,
                                       size_t length,
                                       std::vector<ParseEvent>& events) {
  if (message_complete_) {
    // Caller has not reset after the previous message
    return makeSuccess<size_t>(0);
  }

  events_ = &events;
  size_t consumed = parser_->execute(data, length);
  events_ = nullptr;

  if (parser_->getStatus() == ParserStatus::Error) {
    CONDUIT_LOG(Debug, "response parse error after {} bytes: {}", consumed,
                error_);
    return makeError<size_t>(parserError(error_));
  }
  return makeSuccess<size_t>(std::move(consumed));
}

VoidResult ResponseParser::finish(std::vector<ParseEvent>& events) {
  if (!in_message_) {
    return makeVoidSuccess();
  }

  events_ = &events;
  ParserStatus status = parser_->finish();
  events_ = nullptr;

  if (status == ParserStatus::Error) {
    return makeVoidError(parserError(error_));
  }
  if (in_message_) {
    return makeVoidError(parserError("Response ended before message completed"));
  }
  return makeVoidSuccess();
}

void ResponseParser::reset() {
  parser_->reset();
  headers_.clear();
  last_was_value_ = false;
  in_message_ = false;
  message_complete_ = false;
  error_.clear();
}

ParserCallbackResult ResponseParser::onMessageBegin() {
  in_message_ = true;
  headers_.clear();
  last_was_value_ = false;
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onStatus(const char*, size_t) {
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onHeaderField(const char* data,
                                                   size_t length) {
  if (headers_.empty() || last_was_value_) {
    headers_.emplace_back(std::string(data, length), std::string());
  } else {
    headers_.back().first.append(data, length);
  }
  last_was_value_ = false;
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onHeaderValue(const char* data,
                                                   size_t length) {
  if (headers_.empty()) {
    return ParserCallbackResult::Error;
  }
  headers_.back().second.append(data, length);
  last_was_value_ = true;
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onHeadersComplete() {
  HeadersComplete event;
  event.status_code = parser_->statusCode();
  event.headers = std::move(headers_);
  headers_.clear();
  events_->emplace_back(std::move(event));

  if (skip_body_) {
    return ParserCallbackResult::NoBody;
  }
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onBody(const char* data, size_t length) {
  events_->emplace_back(BodyChunk{std::string(data, length)});
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseParser::onMessageComplete() {
  MessageComplete event;
  event.keep_alive = parser_->shouldKeepAlive();
  events_->emplace_back(event);

  in_message_ = false;
  message_complete_ = true;
  // Stop here so trailing bytes are left to the caller
  return ParserCallbackResult::Pause;
}

void ResponseParser::onError(const std::string& error) { error_ = error; }

}  // namespace http
}  // namespace conduit
