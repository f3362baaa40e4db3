#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/result.hpp"

namespace hivestate::util {

/*
  Raised by storage backends.

  Store managers catch it at their public boundary and turn it into a Result.
*/
class StoreError : public std::runtime_error {
 public:
  StoreError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const {
    return code_;
  }

  Result ToResult() const {
    return Result::Err(code_, what());
  }

 private:
  ErrorCode code_;
};

} // namespace hivestate::util
