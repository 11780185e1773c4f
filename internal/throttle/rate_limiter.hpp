#pragma once

#include <cstdint>

#include "internal/config/consumer_settings.hpp"
#include "internal/util/time.hpp"

namespace shardfeed::throttle {

/*
  Pacing state for one consumer run.

  calls_left counts down within the current one-second call window.
  bytes_read is the payload size of the previous fetch, still to be
  accounted against remaining_bytes, the byte budget carried between
  checks. last_check moves on every check, so the observed rate covers
  only the latest fetch.
*/
struct PacingWindow {
  uint32_t calls_left      = 0;
  uint64_t bytes_read      = 0;
  uint64_t remaining_bytes = 0;

  util::TimePoint window_start{};
  util::TimePoint last_check{};
};

enum class Admission {
  kProceed,
  // Call budget for the current window is spent; wait for the next window.
  kLocalTpsExceeded,
};

/*
  Keeps GetRecords under the per-shard read quotas:
  max_calls_per_second calls and max_bytes_per_second bytes, with bursts up
  to max_bytes_per_window.

  Not thread-safe; owned by a single consumer run.
*/
class RateLimiter {
 public:
  RateLimiter(config::ThroughputLimits limits, util::Clock& clock);

  // Sleeps off any byte-rate cooldown, then checks the call budget.
  Admission Acquire();

  // Byte-rate check for the bytes read by the previous fetch, measured over
  // the time since the last check. Returns the cooldown to wait before the
  // next fetch, zero if none.
  util::Duration ComputeCooldown();

  // Every issued fetch counts against the call budget, failed or not.
  void RecordCall();

  // Payload bytes returned by the latest successful fetch.
  void RecordBytes(uint64_t bytes);

  // Sleeps until one second after the current window started.
  void WaitForNextWindow();

  const PacingWindow& window() const {
    return window_;
  }
  PacingWindow* mutable_window() {
    return &window_;
  }

 private:
  const config::ThroughputLimits limits_;
  util::Clock&                   clock_;
  PacingWindow                   window_;
};

} // namespace shardfeed::throttle
