#include "conduit/core/result.h"

namespace conduit {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "InvalidArgumentError";
    case ErrorCode::NotSupported:
      return "NotSupportedError";
    case ErrorCode::RequestAborted:
      return "RequestAbortedError";
    case ErrorCode::RequestTimeout:
      return "RequestTimeoutError";
    case ErrorCode::Socket:
      return "SocketError";
    case ErrorCode::Parser:
      return "ParserError";
    case ErrorCode::ProtocolViolation:
      return "ProtocolViolationError";
    case ErrorCode::ConnectionClosed:
      return "ConnectionClosedError";
  }
  return "UnknownError";
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
  return os << errorCodeName(error.code) << ": " << error.message;
}

Error invalidArgumentError(const std::string& message) {
  return Error(ErrorCode::InvalidArgument, message);
}

Error notSupportedError(const std::string& message) {
  return Error(ErrorCode::NotSupported, message);
}

Error requestAbortedError() {
  return Error(ErrorCode::RequestAborted, "Request aborted");
}

Error requestTimeoutError() {
  return Error(ErrorCode::RequestTimeout, "Request timeout");
}

Error socketError(const std::string& message) {
  return Error(ErrorCode::Socket, message);
}

Error parserError(const std::string& message) {
  return Error(ErrorCode::Parser, message);
}

Error protocolViolationError(const std::string& message) {
  return Error(ErrorCode::ProtocolViolation, message);
}

Error connectionClosedError() {
  return Error(ErrorCode::ConnectionClosed, "The client is closed");
}

}  // namespace conduit
