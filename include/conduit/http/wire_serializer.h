#ifndef CONDUIT_HTTP_WIRE_SERIALIZER_H
#define CONDUIT_HTTP_WIRE_SERIALIZER_H

#include <cstdint>
#include <string>

#include "conduit/core/compat.h"

namespace conduit {
namespace http {

// Terminates a chunked request body
extern const char kLastChunk[];

/**
 * Request framing inputs, as synthesized when the request was created.
 */
struct WireHead {
  // Request line plus header lines, each CRLF terminated
  const std::string& header_block;
  // Only set when the caller supplied a content-length header
  optional<uint64_t> content_length;
  // Body is a push stream
  bool streaming{false};
  // Buffered body, written as-is
  const std::string& body;
};

/**
 * Bytes written for a request before any streamed body data: header block,
 * explicit content-length, transfer-encoding for unsized streams, the blank
 * line, then the buffered body. The content length is never derived from
 * the body size.
 */
std::string serializeHead(const WireHead& head);

// Streams without an explicit length go out chunked
bool usesChunkedEncoding(const WireHead& head);

// One chunk: hex size, CRLF, data, CRLF. Empty data yields nothing.
std::string encodeChunk(const std::string& data);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_WIRE_SERIALIZER_H
