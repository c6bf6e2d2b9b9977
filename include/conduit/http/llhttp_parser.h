#ifndef CONDUIT_HTTP_LLHTTP_PARSER_H
#define CONDUIT_HTTP_LLHTTP_PARSER_H

#include <memory>

#include "conduit/http/http_parser.h"

// llhttp.h stays out of public headers
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace conduit {
namespace http {

/**
 * HttpParser over llhttp. One instance per connection; not thread-safe.
 *
 * A Pause returned from a callback stops execute() right after that event,
 * and the parser stays Paused until resume(). Bytes past the pause point
 * are not consumed.
 */
class LLHttpParser : public HttpParser {
 public:
  LLHttpParser(HttpParserType type, HttpParserCallbacks* callbacks);
  ~LLHttpParser() override;

  size_t execute(const char* data, size_t length) override;
  void resume() override;
  ParserStatus getStatus() const override { return status_; }
  bool shouldKeepAlive() const override;
  uint16_t statusCode() const override;
  std::string getError() const override;
  void reset() override;
  ParserStatus finish() override;

 private:
  template <ParserCallbackResult (HttpParserCallbacks::*Event)()>
  static int notify(llhttp_t* parser);

  template <ParserCallbackResult (HttpParserCallbacks::*Event)(const char*,
                                                               size_t)>
  static int notifyData(llhttp_t* parser, const char* at, size_t length);

  static int headersComplete(llhttp_t* parser);

  void fail(const char* reason);

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  HttpParserCallbacks* callbacks_;
  ParserStatus status_{ParserStatus::Ok};
};

inline HttpParserPtr createLLHttpParser(HttpParserType type,
                                        HttpParserCallbacks* callbacks) {
  return std::make_unique<LLHttpParser>(type, callbacks);
}

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_LLHTTP_PARSER_H
