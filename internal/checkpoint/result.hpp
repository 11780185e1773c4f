#pragma once

#include <string>
#include <utility>

namespace shardfeed::checkpoint {

/*
  Portable lease/checkpoint store result codes.

  Store implementations must translate backend errors into these.
*/

enum class ErrorCode {
  OK = 0,

  // No checkpoint recorded for the shard (never written, or expired).
  NotFound,

  // Another owner holds an unexpired lease.
  LeaseNotAcquired,

  Conflict,
  Unavailable,
  IOError,
  InternalError
};

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

} // namespace shardfeed::checkpoint
