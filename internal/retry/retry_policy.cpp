#include "retry_policy.hpp"

#include <algorithm>

namespace shardfeed::retry {

namespace {

enum class ErrorClass { kQuotaThrottle, kDependencyThrottle, kFatal };

ErrorClass Classify(stream::ErrorCode code) {
  switch (code) {
    case stream::ErrorCode::ProvisionedThroughputExceeded:
      return ErrorClass::kQuotaThrottle;
    case stream::ErrorCode::KmsThrottling:
      return ErrorClass::kDependencyThrottle;
    case stream::ErrorCode::OK:
    case stream::ErrorCode::ExpiredIterator:
    case stream::ErrorCode::ResourceNotFound:
    case stream::ErrorCode::InvalidArgument:
    case stream::ErrorCode::AccessDenied:
    case stream::ErrorCode::Unavailable:
    case stream::ErrorCode::InternalError:
      return ErrorClass::kFatal;
  }
  return ErrorClass::kFatal;
}

} // namespace

util::Duration RetryPolicy::Backoff(uint32_t attempt) {
  // clamped so the nanosecond count cannot overflow
  const auto exponent = std::min(attempt, kMaxBackoffExponent);
  return std::chrono::duration_cast<util::Duration>(kBackoffBase * (int64_t{1} << exponent));
}

RetryDecision RetryPolicy::OnFailure(RetryState& state, stream::ErrorCode code, util::Duration since_call_start) const {
  const auto error_class = Classify(code);
  if (error_class == ErrorClass::kFatal) {
    return {RetryAction::kFatal, util::Duration::zero()};
  }

  ++state.consecutive_failures;
  if (state.consecutive_failures > max_retry_count_) {
    return {RetryAction::kExhausted, util::Duration::zero()};
  }

  if (error_class == ErrorClass::kQuotaThrottle) {
    const auto cooldown = std::chrono::duration_cast<util::Duration>(kThroughputCooldown);
    return {RetryAction::kRetry, std::max(util::Duration::zero(), cooldown - since_call_start)};
  }

  return {RetryAction::kRetry, Backoff(state.consecutive_failures)};
}

} // namespace shardfeed::retry
