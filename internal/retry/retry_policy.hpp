#pragma once

#include <chrono>
#include <cstdint>

#include "internal/stream/result.hpp"
#include "internal/util/time.hpp"

namespace shardfeed::retry {

// Consecutive failed fetches since the last success. Local to one run.
struct RetryState {
  uint32_t consecutive_failures = 0;
};

enum class RetryAction {
  kRetry,
  // Retriable error, but the retry budget is spent.
  kExhausted,
  kFatal,
};

struct RetryDecision {
  RetryAction    action = RetryAction::kFatal;
  util::Duration delay{};
};

/*
  Classifies a failed GetRecords call.

  ProvisionedThroughputExceeded: retry once a full second has passed since
  the failed call started.
  KmsThrottling: retry after 100ms * 2^n for the n-th consecutive failure.
  Everything else is fatal. Both throttle kinds share one failure counter.

  The backoff exponent stops growing at kMaxBackoffExponent; settings cap
  max_retry_count there, so within a valid budget growth is uncapped.
*/
class RetryPolicy {
 public:
  static constexpr std::chrono::milliseconds kThroughputCooldown{1000};
  static constexpr std::chrono::milliseconds kBackoffBase{100};
  static constexpr uint32_t                  kMaxBackoffExponent = 32;

  explicit RetryPolicy(uint32_t max_retry_count) : max_retry_count_(max_retry_count) {
  }

  RetryDecision OnFailure(RetryState& state, stream::ErrorCode code, util::Duration since_call_start) const;

  void OnSuccess(RetryState& state) const {
    state.consecutive_failures = 0;
  }

  static util::Duration Backoff(uint32_t attempt);

 private:
  uint32_t max_retry_count_;
};

} // namespace shardfeed::retry
