#ifndef CONDUIT_HTTP_HTTP_PARSER_H
#define CONDUIT_HTTP_HTTP_PARSER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace conduit {
namespace http {

enum class HttpParserType { REQUEST, RESPONSE, BOTH };

// Parser callback results
enum class ParserCallbackResult {
  Success = 0,
  Error = -1,
  Pause = 1,
  NoBody = 2  // Only meaningful from onHeadersComplete
};

enum class ParserStatus { Ok, Paused, Error };

class HttpParser;
class HttpParserCallbacks;

using HttpParserPtr = std::unique_ptr<HttpParser>;

/**
 * HTTP parser callbacks interface
 * Implement this to receive parsing events
 */
class HttpParserCallbacks {
 public:
  virtual ~HttpParserCallbacks() = default;

  virtual ParserCallbackResult onMessageBegin() = 0;

  /**
   * Called when the status text is parsed (response only)
   */
  virtual ParserCallbackResult onStatus(const char* data, size_t length) = 0;

  /**
   * Called for each header field fragment. A field split across reads is
   * reported in several calls.
   */
  virtual ParserCallbackResult onHeaderField(const char* data,
                                             size_t length) = 0;

  /**
   * Called for each header value fragment
   */
  virtual ParserCallbackResult onHeaderValue(const char* data,
                                             size_t length) = 0;

  /**
   * Called when headers are complete. Returning NoBody tells the parser
   * the message carries no body regardless of framing headers.
   */
  virtual ParserCallbackResult onHeadersComplete() = 0;

  virtual ParserCallbackResult onBody(const char* data, size_t length) = 0;

  virtual ParserCallbackResult onMessageComplete() = 0;

  virtual void onError(const std::string& error) = 0;
};

/**
 * Abstract HTTP/1.x parser interface
 */
class HttpParser {
 public:
  virtual ~HttpParser() = default;

  /**
   * Execute parser on data
   * @return Number of bytes consumed. Less than |length| when paused or
   * on error.
   */
  virtual size_t execute(const char* data, size_t length) = 0;

  virtual void resume() = 0;

  virtual ParserStatus getStatus() const = 0;

  virtual bool shouldKeepAlive() const = 0;

  virtual uint16_t statusCode() const = 0;

  virtual std::string getError() const = 0;

  virtual void reset() = 0;

  /**
   * Signal end of input. Completes a message delimited by connection close.
   */
  virtual ParserStatus finish() = 0;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_PARSER_H
