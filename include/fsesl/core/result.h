#ifndef FSESL_RESULT_H
#define FSESL_RESULT_H

#include <string>
#include <utility>

#include "fsesl/core/compat.h"
#include "fsesl/io_result.h"

namespace fsesl {

// Error codes reported by the event socket client
namespace errors {
constexpr int TRANSPORT_ERROR = 1;   // dial/read/write failure
constexpr int MALFORMED_FRAME = 2;   // bad Content-Length or truncated body
constexpr int PROTOCOL_ERROR = 3;    // unexpected or missing reply marker
constexpr int COMMAND_FAILED = 4;    // remote answered with -ERR
constexpr int INVALID_ARGUMENT = 5;  // caller supplied unusable input
}  // namespace errors

inline const char* errorCodeToString(int code) {
  switch (code) {
    case errors::TRANSPORT_ERROR: return "TransportError";
    case errors::MALFORMED_FRAME: return "MalformedFrame";
    case errors::PROTOCOL_ERROR: return "ProtocolError";
    case errors::COMMAND_FAILED: return "CommandFailed";
    case errors::INVALID_ARGUMENT: return "InvalidArgument";
    default: return "Unknown";
  }
}

struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}

  std::string toString() const {
    return std::string(errorCodeToString(code)) + ": " + message;
  }
};

template <typename T>
using Result = variant<T, Error>;

// For cleaner API, we define a VoidResult type
using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

inline VoidResult makeVoidError(int code, const std::string& message) {
  return VoidResult(Error(code, message));
}

template <typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

// Socket level failures surface as transport errors
template <typename T>
Error ioResultToError(const IoResult<T>& io_result) {
  Error err;
  err.code = errors::TRANSPORT_ERROR;
  err.message =
      io_result.error_info ? io_result.error_info->message : "Unknown error";
  return err;
}

}  // namespace fsesl

#endif  // FSESL_RESULT_H
