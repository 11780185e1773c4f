#include "rate_limiter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace shardfeed::throttle {

namespace {

constexpr auto kCallWindow = std::chrono::seconds(1);

} // namespace

RateLimiter::RateLimiter(config::ThroughputLimits limits, util::Clock& clock) : limits_(limits), clock_(clock) {
  const auto now          = clock_.Now();
  window_.calls_left      = limits_.max_calls_per_second;
  window_.remaining_bytes = limits_.max_bytes_per_window;
  window_.window_start    = now;
  window_.last_check      = now;
}

util::Duration RateLimiter::ComputeCooldown() {
  const auto now       = clock_.Now();
  const auto elapsed   = std::chrono::duration<double>(now - window_.last_check).count();
  // every check restarts the measurement, empty reads included
  window_.last_check   = now;

  // refill in whole seconds
  if (elapsed >= 1.0) {
    const auto whole_seconds = static_cast<uint64_t>(std::floor(elapsed));
    window_.remaining_bytes += whole_seconds * limits_.max_bytes_per_second;
  }
  window_.remaining_bytes = std::min(window_.remaining_bytes, limits_.max_bytes_per_window);

  if (window_.bytes_read == 0) {
    return util::Duration::zero();
  }

  const bool rate_exceeded = elapsed <= 0.0 || static_cast<double>(window_.bytes_read) / elapsed > static_cast<double>(limits_.max_bytes_per_second);

  if (window_.remaining_bytes <= window_.bytes_read || rate_exceeded) {
    const auto seconds = (window_.bytes_read + limits_.max_bytes_per_second - 1) / limits_.max_bytes_per_second;
    return std::chrono::duration_cast<util::Duration>(std::chrono::seconds(seconds));
  }

  window_.remaining_bytes -= window_.bytes_read;
  window_.bytes_read = 0;
  return util::Duration::zero();
}

Admission RateLimiter::Acquire() {
  const auto cooldown = ComputeCooldown();
  if (cooldown > util::Duration::zero()) {
    clock_.SleepFor(cooldown);
    // the cooldown pays for the previous fetch
    window_.last_check = clock_.Now();
    window_.bytes_read = 0;
  }

  // every new second, a fresh set of calls
  const auto now = clock_.Now();
  if (now - window_.window_start >= kCallWindow) {
    window_.calls_left   = limits_.max_calls_per_second;
    window_.window_start = now;
  }

  if (window_.calls_left < 1) {
    return Admission::kLocalTpsExceeded;
  }
  return Admission::kProceed;
}

void RateLimiter::RecordCall() {
  if (window_.calls_left > 0) --window_.calls_left;
}

void RateLimiter::RecordBytes(uint64_t bytes) {
  window_.bytes_read = bytes;
}

void RateLimiter::WaitForNextWindow() {
  const auto waited = clock_.Since(window_.window_start);
  if (waited < kCallWindow) {
    clock_.SleepFor(std::chrono::duration_cast<util::Duration>(kCallWindow) - waited);
  }
}

} // namespace shardfeed::throttle
