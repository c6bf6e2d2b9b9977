#ifndef CONDUIT_CORE_IO_RESULT_H
#define CONDUIT_CORE_IO_RESULT_H

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include "conduit/core/compat.h"

namespace conduit {

// System error type for I/O operations
struct SystemError {
  int error_code;
  std::string message;

  SystemError(int code, const std::string& msg)
      : error_code(code), message(msg) {}
};

// Result of a non-blocking socket call
template <typename T>
struct IoResult {
  optional<T> value;
  optional<SystemError> error_info;

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }

  T& operator*() { return *value; }
  const T& operator*() const { return *value; }

  static IoResult success(T val) {
    IoResult result;
    result.value = std::move(val);
    return result;
  }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg);
    return result;
  }

  static IoResult from_errno(int err) { return error(err, std::strerror(err)); }

  // EAGAIN/EWOULDBLOCK: no data right now, not a failure
  bool wouldBlock() const {
    if (!error_info)
      return false;
    return error_info->error_code == EAGAIN ||
           error_info->error_code == EWOULDBLOCK;
  }

  int error_code() const { return error_info ? error_info->error_code : 0; }
};

using IoCallResult = IoResult<size_t>;

}  // namespace conduit

#endif  // CONDUIT_CORE_IO_RESULT_H
