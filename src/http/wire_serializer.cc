#include "conduit/http/wire_serializer.h"

#include <fmt/format.h>

namespace conduit {
namespace http {

const char kLastChunk[] = "0\r\n\r\n";

bool usesChunkedEncoding(const WireHead& head) {
  return head.streaming && !head.content_length.has_value();
}

std::string serializeHead(const WireHead& head) {
  std::string out;
  out.reserve(head.header_block.size() + head.body.size() + 64);

  out.append(head.header_block);
  if (head.content_length) {
    out.append(fmt::format("content-length: {}\r\n", *head.content_length));
  } else if (usesChunkedEncoding(head)) {
    out.append("transfer-encoding: chunked\r\n");
  }
  out.append("\r\n");

  if (!head.streaming) {
    out.append(head.body);
  }
  return out;
}

std::string encodeChunk(const std::string& data) {
  if (data.empty()) {
    // A zero-size chunk would end the body
    return std::string();
  }
  std::string out = fmt::format("{:x}\r\n", data.size());
  out.append(data);
  out.append("\r\n");
  return out;
}

}  // namespace http
}  // namespace conduit
