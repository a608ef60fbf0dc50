#ifndef FSESL_IO_RESULT_H
#define FSESL_IO_RESULT_H

#include <cerrno>
#include <cstring>
#include <string>

#include "fsesl/core/compat.h"

namespace fsesl {

// System error type for I/O operations
struct SystemError {
  int error_code;
  std::string message;

  SystemError(int code, const std::string& msg)
      : error_code(code), message(msg) {}
};

// Result of a raw socket call: a value or an errno-style failure
template <typename T>
struct IoResult {
  optional<T> value;
  optional<SystemError> error_info;

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }

  T& operator*() { return *value; }
  const T& operator*() const { return *value; }
  T* operator->() { return &(*value); }
  const T* operator->() const { return &(*value); }

  static IoResult success(T val) {
    IoResult result;
    result.value = std::move(val);
    return result;
  }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg.empty() ? std::strerror(code) : msg);
    return result;
  }

  static IoResult from_errno(int err) {
    return error(err, std::strerror(err));
  }

  int error_code() const {
    return error_info ? error_info->error_code : 0;
  }
};

// Specialization for void-like results (using nullptr_t to avoid void in templates)
template <>
struct IoResult<std::nullptr_t> {
  optional<SystemError> error_info;

  bool ok() const { return !error_info.has_value(); }
  explicit operator bool() const { return ok(); }

  static IoResult success() { return IoResult(); }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg.empty() ? std::strerror(code) : msg);
    return result;
  }

  static IoResult from_errno(int err) {
    return error(err, std::strerror(err));
  }

  int error_code() const {
    return error_info ? error_info->error_code : 0;
  }
};

using IoCallResult = IoResult<size_t>;
using IoVoidResult = IoResult<std::nullptr_t>;

}  // namespace fsesl

#endif  // FSESL_IO_RESULT_H
