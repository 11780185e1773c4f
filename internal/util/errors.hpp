#pragma once

#include <stdexcept>
#include <string>

namespace shardfeed::util {

/*
  Central error types.

  Thrown out of PollingShardConsumer::Run() when a shard run cannot
  continue. Expected outcomes (shard closed, stop requested, lease lost)
  are never reported through these.
*/

// Non-retriable stream service error, or a lost iterator request.
class StreamFailure : public std::runtime_error {
 public:
  explicit StreamFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A throttle error repeated more often than max_retry_count allows.
class RetriesExhausted : public std::runtime_error {
 public:
  explicit RetriesExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lease/checkpoint store failures other than lease contention.
class CheckpointFailure : public std::runtime_error {
 public:
  explicit CheckpointFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shardfeed::util
