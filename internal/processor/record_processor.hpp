#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/checkpoint/record_checkpointer.hpp"
#include "internal/util/time.hpp"
#include "shardfeed/v1/stream.pb.h"

namespace shardfeed::processor {

enum class ShutdownReason {
  // The owning worker asked the consumer to stop.
  kRequested,
  // The shard was closed and fully read.
  kTerminate,
  // Lease renewal lost the shard to another owner.
  kLeaseLost,
};

constexpr std::string_view ToString(ShutdownReason reason) {
  switch (reason) {
    case ShutdownReason::kRequested:
      return "requested";
    case ShutdownReason::kTerminate:
      return "terminate";
    case ShutdownReason::kLeaseLost:
      return "lease_lost";
  }
  return "unknown";
}

struct InitializationInput {
  std::string shard_id;
  // Empty when the shard was never checkpointed.
  std::string checkpoint;
};

struct ProcessRecordsInput {
  google::protobuf::RepeatedPtrField<shardfeed::v1::Record> records;
  int64_t                                                   millis_behind_latest = 0;
  checkpoint::RecordProcessorCheckpointer*                  checkpointer         = nullptr;

  // When the fetch started and when delivery started.
  util::TimePoint cache_entry_time{};
  util::TimePoint cache_exit_time{};
};

struct ShutdownInput {
  ShutdownReason                           reason = ShutdownReason::kRequested;
  checkpoint::RecordProcessorCheckpointer* checkpointer = nullptr;
};

/*
  Application callback for one shard.

  Initialize is called once before any batch; ProcessRecords receives
  batches in shard order; Shutdown is called at most once, last.
*/
class RecordProcessor {
 public:
  virtual ~RecordProcessor() = default;

  virtual void Initialize(const InitializationInput& input) = 0;

  virtual void ProcessRecords(const ProcessRecordsInput& input) = 0;

  virtual void Shutdown(const ShutdownInput& input) = 0;
};

} // namespace shardfeed::processor
