#include "internal/throttle/rate_limiter.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "tests/unit/fakes.hpp"

namespace {

using shardfeed::config::ThroughputLimits;
using shardfeed::testing::ManualClock;
using shardfeed::throttle::Admission;
using shardfeed::throttle::RateLimiter;

using std::chrono::milliseconds;
using std::chrono::seconds;

constexpr uint64_t kBytesPerSecond = 2'000'000;
constexpr uint64_t kBytesPerWindow = 10'000'000;

ThroughputLimits Limits() {
  ThroughputLimits limits;
  limits.max_calls_per_second = 5;
  limits.max_bytes_per_second = kBytesPerSecond;
  limits.max_bytes_per_window = kBytesPerWindow;
  return limits;
}

void TestFreshLimiterAdmitsWithoutSleeping() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);

  assert(limiter.Acquire() == Admission::kProceed);
  assert(clock.sleeps.empty());
  assert(limiter.window().calls_left == 5);
}

void TestSpentCallBudgetWithinWindowIsLocalTpsExceeded() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  limiter.mutable_window()->calls_left   = 0;
  limiter.mutable_window()->window_start = clock.Now() - milliseconds(500);

  assert(limiter.Acquire() == Admission::kLocalTpsExceeded);
  assert(clock.sleeps.empty());
}

void TestCallBudgetRefillsAfterOneSecond() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  for (int i = 0; i < 5; ++i) {
    assert(limiter.Acquire() == Admission::kProceed);
    limiter.RecordCall();
  }
  assert(limiter.Acquire() == Admission::kLocalTpsExceeded);

  clock.Advance(milliseconds(300));
  limiter.WaitForNextWindow();
  assert(clock.sleeps.size() == 1);
  assert(clock.sleeps.back() == milliseconds(700));

  assert(limiter.Acquire() == Admission::kProceed);
  assert(limiter.window().calls_left == 5);
}

void TestNoBytesReadMeansNoCooldown() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  limiter.mutable_window()->calls_left   = 2;
  limiter.mutable_window()->bytes_read   = 0;
  limiter.mutable_window()->window_start = clock.Now() - seconds(2);

  assert(limiter.Acquire() == Admission::kProceed);
  assert(clock.sleeps.empty());
}

void TestFullWindowReadInOneSecondCoolsDownFiveSeconds() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  auto* window            = limiter.mutable_window();
  window->calls_left      = 2;
  window->bytes_read      = kBytesPerWindow;
  window->remaining_bytes = kBytesPerWindow;
  window->last_check      = clock.Now() - seconds(1);
  window->window_start    = clock.Now() - seconds(2);

  assert(limiter.Acquire() == Admission::kProceed);
  assert(clock.sleeps.size() == 1);
  assert(clock.sleeps[0] == seconds(5));

  // the cooldown paid for those bytes
  assert(limiter.window().bytes_read == 0);
}

void TestSixMegabytesOverThreeSecondsNeedsNoCooldown() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  auto* window            = limiter.mutable_window();
  window->calls_left      = 2;
  window->bytes_read      = kBytesPerSecond * 3;
  window->remaining_bytes = kBytesPerWindow;
  window->last_check      = clock.Now() - seconds(3);
  window->window_start    = clock.Now() - seconds(3);

  assert(limiter.Acquire() == Admission::kProceed);
  assert(clock.sleeps.empty());
  assert(limiter.window().remaining_bytes == kBytesPerWindow - kBytesPerSecond * 3);
}

void TestBurstAboveRateCoolsDownProportionally() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  auto* window            = limiter.mutable_window();
  window->calls_left      = 2;
  window->bytes_read      = kBytesPerSecond * 4;
  window->remaining_bytes = kBytesPerWindow * 3;
  window->last_check      = clock.Now() - milliseconds(200);
  window->window_start    = clock.Now() - seconds(3);

  assert(limiter.ComputeCooldown() == seconds(4));
  // carried budget never exceeds one window
  assert(limiter.window().remaining_bytes == kBytesPerWindow);
}

void TestCooldownRoundsPartialSecondsUp() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  auto* window            = limiter.mutable_window();
  window->bytes_read      = kBytesPerSecond + 1;
  window->remaining_bytes = kBytesPerWindow;
  window->last_check      = clock.Now();

  assert(limiter.ComputeCooldown() == seconds(2));
}

void TestCooldownIsReproducible() {
  for (int run = 0; run < 3; ++run) {
    ManualClock clock;
    RateLimiter limiter(Limits(), clock);
    limiter.RecordBytes(kBytesPerWindow);
    clock.Advance(seconds(1));
    assert(limiter.ComputeCooldown() == seconds(5));
  }
}

// One fetch cycle as the consumer drives it: admit, call, account the bytes.
void Fetch(RateLimiter& limiter, ManualClock& clock, shardfeed::util::Duration call_time, uint64_t bytes) {
  assert(limiter.Acquire() == Admission::kProceed);
  limiter.RecordCall();
  clock.Advance(call_time);
  limiter.RecordBytes(bytes);
}

void TestBurstAfterEmptyReadsStillCoolsDown() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  for (int i = 0; i < 10; ++i) {
    Fetch(limiter, clock, milliseconds(0), 0);
    clock.SleepFor(seconds(1));
  }
  clock.sleeps.clear();

  Fetch(limiter, clock, milliseconds(200), kBytesPerSecond * 4);

  assert(limiter.Acquire() == Admission::kProceed);
  assert(clock.sleeps.size() == 1);
  assert(clock.sleeps[0] == seconds(4));
}

void TestEmptyReadsStillRefillByteBudget() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  limiter.mutable_window()->remaining_bytes = 0;

  Fetch(limiter, clock, milliseconds(0), 0);
  clock.SleepFor(seconds(3));
  Fetch(limiter, clock, milliseconds(0), 0);

  assert(limiter.window().remaining_bytes == kBytesPerSecond * 3);
}

void TestFailedCallsStillSpendCallBudget() {
  ManualClock clock;
  RateLimiter limiter(Limits(), clock);
  limiter.RecordCall();
  limiter.RecordCall();
  assert(limiter.window().calls_left == 3);
}

} // namespace

int main() {
  TestFreshLimiterAdmitsWithoutSleeping();
  TestSpentCallBudgetWithinWindowIsLocalTpsExceeded();
  TestCallBudgetRefillsAfterOneSecond();
  TestNoBytesReadMeansNoCooldown();
  TestFullWindowReadInOneSecondCoolsDownFiveSeconds();
  TestSixMegabytesOverThreeSecondsNeedsNoCooldown();
  TestBurstAboveRateCoolsDownProportionally();
  TestCooldownRoundsPartialSecondsUp();
  TestCooldownIsReproducible();
  TestFailedCallsStillSpendCallBudget();
  TestBurstAfterEmptyReadsStillCoolsDown();
  TestEmptyReadsStillRefillByteBudget();

  std::cout << "shardfeed_unit_rate_limiter: pass\n";
  return 0;
}
