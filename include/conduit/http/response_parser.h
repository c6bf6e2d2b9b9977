#ifndef CONDUIT_HTTP_RESPONSE_PARSER_H
#define CONDUIT_HTTP_RESPONSE_PARSER_H

#include <cstdint>
#include <string>
#include <vector>

#include "conduit/core/result.h"
#include "conduit/http/headers.h"
#include "conduit/http/http_parser.h"

namespace conduit {
namespace http {

struct HeadersComplete {
  uint16_t status_code{0};
  HeaderPairs headers;
};

struct BodyChunk {
  std::string data;
};

struct MessageComplete {
  // Whether the connection may carry another exchange
  bool keep_alive{true};
};

using ParseEvent = variant<HeadersComplete, BodyChunk, MessageComplete>;

/**
 * Incremental HTTP/1.1 response tokenizer.
 *
 * Bytes are fed as they arrive; each call appends the events it produced,
 * in order. The parser stops right after a MessageComplete and reports how
 * many bytes it consumed, so anything that follows a message stays with the
 * caller. reset() must be called before the next message is fed.
 */
class ResponseParser : private HttpParserCallbacks {
 public:
  ResponseParser();
  ~ResponseParser() override;

  ResponseParser(const ResponseParser&) = delete;
  ResponseParser& operator=(const ResponseParser&) = delete;

  /**
   * @return bytes consumed, or a Parser error carrying llhttp's reason
   */
  Result<size_t> execute(const char* data,
                         size_t length,
                         std::vector<ParseEvent>& events);

  /**
   * End of input. Completes a body delimited by connection close; fails if
   * a message was cut short.
   */
  VoidResult finish(std::vector<ParseEvent>& events);

  // Response to a HEAD request: framing headers do not announce a body
  void setSkipBody(bool skip) { skip_body_ = skip; }
  bool skipBody() const { return skip_body_; }

  // Prepare for the next message. The skip-body setting is kept.
  void reset();

  // True between the first byte of a message and its completion
  bool messageInProgress() const { return in_message_; }

  bool messageComplete() const { return message_complete_; }

 private:
  // HttpParserCallbacks
  ParserCallbackResult onMessageBegin() override;
  ParserCallbackResult onStatus(const char* data, size_t length) override;
  ParserCallbackResult onHeaderField(const char* data, size_t length) override;
  ParserCallbackResult onHeaderValue(const char* data, size_t length) override;
  ParserCallbackResult onHeadersComplete() override;
  ParserCallbackResult onBody(const char* data, size_t length) override;
  ParserCallbackResult onMessageComplete() override;
  void onError(const std::string& error) override;

  HttpParserPtr parser_;
  std::vector<ParseEvent>* events_{nullptr};

  HeaderPairs headers_;
  bool last_was_value_{false};
  bool skip_body_{false};
  bool in_message_{false};
  bool message_complete_{false};
  std::string error_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_RESPONSE_PARSER_H
