#ifndef CONDUIT_CORE_RESULT_H
#define CONDUIT_CORE_RESULT_H

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

#include "conduit/core/compat.h"

namespace conduit {

// Error taxonomy surfaced to callers. Synchronous validation failures use
// InvalidArgument / NotSupported; everything else is delivered
// asynchronously through the request callback or delivery sink.
enum class ErrorCode {
  InvalidArgument,
  NotSupported,
  RequestAborted,
  RequestTimeout,
  Socket,
  Parser,
  ProtocolViolation,
  ConnectionClosed
};

const char* errorCodeName(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::Socket};
  std::string message;

  Error() = default;
  Error(ErrorCode c, const std::string& m) : code(c), message(m) {}

  bool operator==(const Error& other) const {
    return code == other.code && message == other.message;
  }
  bool operator!=(const Error& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

// Factories matching the error classes callers match on.
Error invalidArgumentError(const std::string& message);
Error notSupportedError(const std::string& message);
Error requestAbortedError();
Error requestTimeoutError();
Error socketError(const std::string& message);
Error parserError(const std::string& message);
Error protocolViolationError(const std::string& message);
Error connectionClosedError();

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
bool isSuccess(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& errorOf(const Result<T>& result) {
  return get<Error>(result);
}

}  // namespace conduit

#endif  // CONDUIT_CORE_RESULT_H
