#include "conduit/http/llhttp_parser.h"

#include <llhttp.h>

namespace conduit {
namespace http {

namespace {

llhttp_type_t toLlhttpType(HttpParserType type) {
  switch (type) {
    case HttpParserType::REQUEST:
      return HTTP_REQUEST;
    case HttpParserType::RESPONSE:
      return HTTP_RESPONSE;
    case HttpParserType::BOTH:
      break;
  }
  return HTTP_BOTH;
}

// llhttp treats any non-zero return as an error, except HPE_PAUSED
int toLlhttpResult(ParserCallbackResult result) {
  switch (result) {
    case ParserCallbackResult::Error:
      return HPE_USER;
    case ParserCallbackResult::Pause:
      return HPE_PAUSED;
    case ParserCallbackResult::Success:
    case ParserCallbackResult::NoBody:
      break;
  }
  return HPE_OK;
}

HttpParserCallbacks* callbacksOf(llhttp_t* parser) {
  return static_cast<HttpParserCallbacks*>(parser->data);
}

}  // namespace

template <ParserCallbackResult (HttpParserCallbacks::*Event)()>
int LLHttpParser::notify(llhttp_t* parser) {
  HttpParserCallbacks* callbacks = callbacksOf(parser);
  return callbacks ? toLlhttpResult((callbacks->*Event)()) : HPE_OK;
}

template <ParserCallbackResult (HttpParserCallbacks::*Event)(const char*,
                                                             size_t)>
int LLHttpParser::notifyData(llhttp_t* parser,
                             const char* at,
                             size_t length) {
  HttpParserCallbacks* callbacks = callbacksOf(parser);
  return callbacks ? toLlhttpResult((callbacks->*Event)(at, length)) : HPE_OK;
}

int LLHttpParser::headersComplete(llhttp_t* parser) {
  HttpParserCallbacks* callbacks = callbacksOf(parser);
  if (!callbacks) {
    return HPE_OK;
  }
  const ParserCallbackResult result = callbacks->onHeadersComplete();
  // 1 tells llhttp the message has no body whatever its framing headers say
  return result == ParserCallbackResult::NoBody ? 1 : toLlhttpResult(result);
}

LLHttpParser::LLHttpParser(HttpParserType type, HttpParserCallbacks* callbacks)
    : parser_(std::make_unique<llhttp_t>()),
      settings_(std::make_unique<llhttp_settings_t>()),
      callbacks_(callbacks) {
  llhttp_settings_init(settings_.get());
  settings_->on_message_begin =
      &LLHttpParser::notify<&HttpParserCallbacks::onMessageBegin>;
  settings_->on_status =
      &LLHttpParser::notifyData<&HttpParserCallbacks::onStatus>;
  settings_->on_header_field =
      &LLHttpParser::notifyData<&HttpParserCallbacks::onHeaderField>;
  settings_->on_header_value =
      &LLHttpParser::notifyData<&HttpParserCallbacks::onHeaderValue>;
  settings_->on_headers_complete = &LLHttpParser::headersComplete;
  settings_->on_body = &LLHttpParser::notifyData<&HttpParserCallbacks::onBody>;
  settings_->on_message_complete =
      &LLHttpParser::notify<&HttpParserCallbacks::onMessageComplete>;

  llhttp_init(parser_.get(), toLlhttpType(type), settings_.get());
  parser_->data = callbacks_;
}

LLHttpParser::~LLHttpParser() = default;

size_t LLHttpParser::execute(const char* data, size_t length) {
  if (status_ == ParserStatus::Error) {
    return 0;
  }

  const llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);
  if (err == HPE_OK) {
    status_ = ParserStatus::Ok;
    return length;
  }

  // On pause or error llhttp records where it stopped
  const char* stop = llhttp_get_error_pos(parser_.get());
  const size_t consumed = stop ? static_cast<size_t>(stop - data) : 0;
  if (err == HPE_PAUSED) {
    status_ = ParserStatus::Paused;
  } else {
    fail(llhttp_get_error_reason(parser_.get()));
  }
  return consumed;
}

void LLHttpParser::resume() {
  if (status_ != ParserStatus::Paused) {
    return;
  }
  llhttp_resume(parser_.get());
  status_ = ParserStatus::Ok;
}

bool LLHttpParser::shouldKeepAlive() const {
  return llhttp_should_keep_alive(parser_.get()) != 0;
}

uint16_t LLHttpParser::statusCode() const {
  return static_cast<uint16_t>(parser_->status_code);
}

std::string LLHttpParser::getError() const {
  if (status_ != ParserStatus::Error) {
    return std::string();
  }
  const char* reason = llhttp_get_error_reason(parser_.get());
  return reason ? reason : llhttp_errno_name(llhttp_get_errno(parser_.get()));
}

void LLHttpParser::reset() {
  llhttp_reset(parser_.get());
  parser_->data = callbacks_;
  status_ = ParserStatus::Ok;
}

ParserStatus LLHttpParser::finish() {
  switch (status_) {
    case ParserStatus::Error:
      return status_;
    case ParserStatus::Paused:
      llhttp_resume(parser_.get());
      break;
    case ParserStatus::Ok:
      break;
  }

  const llhttp_errno_t err = llhttp_finish(parser_.get());
  if (err == HPE_OK) {
    status_ = ParserStatus::Ok;
  } else if (err == HPE_PAUSED) {
    // The close completed a message whose callback paused
    status_ = ParserStatus::Paused;
  } else {
    fail(llhttp_errno_name(err));
  }
  return status_;
}

void LLHttpParser::fail(const char* reason) {
  status_ = ParserStatus::Error;
  if (callbacks_) {
    callbacks_->onError(reason ? reason : "parse error");
  }
}

}  // namespace http
}  // namespace conduit
