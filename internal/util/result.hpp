#pragma once

#include <string>
#include <type_traits>
#include <utility>

namespace hivestate::util {

/*
  Portable result codes.

  Backends translate pqxx / sqlite3 / redis++ failures into these.
  Upper layers never depend on driver error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  Unavailable,
  Timeout,

  InvalidArgument,
  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

// Store unreachable or not answering in time.
constexpr bool IsConnectivity(ErrorCode code) {
  return code == ErrorCode::Unavailable || code == ErrorCode::Timeout || code == ErrorCode::Busy || code == ErrorCode::IOError;
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  Result carrying a value on success.

  value is default constructed on failure.
*/
template <typename T>
struct ValueResult {
  Result status;
  T      value{};

  static ValueResult Ok(T v) {
    return {Result::Ok(), std::move(v)};
  }

  static ValueResult Err(ErrorCode c, std::string msg = {}) {
    return {Result::Err(c, std::move(msg)), T{}};
  }

  static ValueResult Err(Result r) {
    return {std::move(r), T{}};
  }

  bool ok() const {
    return static_cast<bool>(status);
  }

  explicit operator bool() const {
    return ok();
  }
};

// Status of either result shape, for code generic over both.
inline const Result& StatusOf(const Result& r) {
  return r;
}

template <typename T>
const Result& StatusOf(const ValueResult<T>& r) {
  return r.status;
}

// Failed R carrying r; R is Result or a ValueResult.
template <typename R>
R FailWith(Result r) {
  if constexpr (std::is_same_v<R, Result>) {
    return r;
  } else {
    return R::Err(std::move(r));
  }
}

} // namespace hivestate::util
