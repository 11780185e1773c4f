#include "internal/retry/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using shardfeed::retry::RetryAction;
using shardfeed::retry::RetryPolicy;
using shardfeed::retry::RetryState;
using shardfeed::stream::ErrorCode;

using std::chrono::milliseconds;

void TestThroughputExceededWaitsOutTheSecond() {
  const RetryPolicy policy(5);
  RetryState        state;

  auto decision = policy.OnFailure(state, ErrorCode::ProvisionedThroughputExceeded, milliseconds(300));
  assert(decision.action == RetryAction::kRetry);
  assert(decision.delay == milliseconds(700));
  assert(state.consecutive_failures == 1);
}

void TestThroughputExceededAfterSlowCallRetriesImmediately() {
  const RetryPolicy policy(5);
  RetryState        state;

  auto decision = policy.OnFailure(state, ErrorCode::ProvisionedThroughputExceeded, milliseconds(1500));
  assert(decision.action == RetryAction::kRetry);
  assert(decision.delay == milliseconds(0));
}

void TestKmsThrottlingBacksOffExponentially() {
  const RetryPolicy policy(10);
  RetryState        state;

  for (uint32_t n = 1; n <= 6; ++n) {
    auto decision = policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0));
    assert(decision.action == RetryAction::kRetry);
    assert(decision.delay == milliseconds(100) * (1 << n));
  }
}

void TestBackoffDoesNotOverflowForLargeAttempts() {
  constexpr uint32_t kMax = RetryPolicy::kMaxBackoffExponent;
  assert(RetryPolicy::Backoff(1000) == RetryPolicy::Backoff(kMax));
  assert(RetryPolicy::Backoff(kMax) > RetryPolicy::Backoff(kMax - 1));
}

void TestRetryBudgetIsSharedAcrossThrottleKinds() {
  const RetryPolicy policy(3);
  RetryState        state;

  assert(policy.OnFailure(state, ErrorCode::ProvisionedThroughputExceeded, milliseconds(0)).action == RetryAction::kRetry);
  assert(policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0)).action == RetryAction::kRetry);
  assert(policy.OnFailure(state, ErrorCode::ProvisionedThroughputExceeded, milliseconds(0)).action == RetryAction::kRetry);
  assert(policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0)).action == RetryAction::kExhausted);
  assert(state.consecutive_failures == 4);
}

void TestSuccessResetsTheCounter() {
  const RetryPolicy policy(2);
  RetryState        state;

  (void)policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0));
  (void)policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0));
  policy.OnSuccess(state);
  assert(state.consecutive_failures == 0);

  auto decision = policy.OnFailure(state, ErrorCode::KmsThrottling, milliseconds(0));
  assert(decision.action == RetryAction::kRetry);
  assert(decision.delay == milliseconds(200));
}

void TestOtherErrorsAreFatalAndDoNotCount() {
  const RetryPolicy policy(5);
  RetryState        state;

  for (auto code : {ErrorCode::ExpiredIterator, ErrorCode::ResourceNotFound, ErrorCode::InvalidArgument, ErrorCode::AccessDenied,
                    ErrorCode::Unavailable, ErrorCode::InternalError}) {
    auto decision = policy.OnFailure(state, code, milliseconds(0));
    assert(decision.action == RetryAction::kFatal);
  }
  assert(state.consecutive_failures == 0);
}

void TestZeroRetryBudgetFailsOnFirstThrottle() {
  const RetryPolicy policy(0);
  RetryState        state;

  assert(policy.OnFailure(state, ErrorCode::ProvisionedThroughputExceeded, milliseconds(0)).action == RetryAction::kExhausted);
}

} // namespace

int main() {
  TestThroughputExceededWaitsOutTheSecond();
  TestThroughputExceededAfterSlowCallRetriesImmediately();
  TestKmsThrottlingBacksOffExponentially();
  TestBackoffDoesNotOverflowForLargeAttempts();
  TestRetryBudgetIsSharedAcrossThrottleKinds();
  TestSuccessResetsTheCounter();
  TestOtherErrorsAreFatalAndDoNotCount();
  TestZeroRetryBudgetFailsOnFirstThrottle();

  std::cout << "shardfeed_unit_retry_policy: pass\n";
  return 0;
}
