#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace shardfeed::stream {

/*
  Stream service result codes.

  Closed set: clients map every transport/service error onto one of these,
  and the retry policy handles each explicitly.
*/

enum class ErrorCode {
  OK = 0,

  // Per-shard read quota exceeded on the service side.
  ProvisionedThroughputExceeded,
  // The key-management dependency throttled decryption.
  KmsThrottling,

  ExpiredIterator,
  ResourceNotFound,
  InvalidArgument,
  AccessDenied,
  Unavailable,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::ProvisionedThroughputExceeded:
      return "provisioned_throughput_exceeded";
    case ErrorCode::KmsThrottling:
      return "kms_throttling";
    case ErrorCode::ExpiredIterator:
      return "expired_iterator";
    case ErrorCode::ResourceNotFound:
      return "resource_not_found";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::AccessDenied:
      return "access_denied";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
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

} // namespace shardfeed::stream
