#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace shardfeed::util {

/*
  Time utilities. Everything time-dependent in the consumer goes through a
  Clock so throttling and pacing can be replayed exactly in tests.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;
using Duration    = SystemClock::duration;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  virtual void SleepFor(Duration d) = 0;

  Duration Since(TimePoint tp) const {
    return Now() - tp;
  }
};

class RealClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(Duration d) override;
};

// Process-wide RealClock used when no clock is injected.
Clock& DefaultClock();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace shardfeed::util
