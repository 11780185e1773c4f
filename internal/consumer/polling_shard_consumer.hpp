#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/checkpoint/checkpointer.hpp"
#include "internal/checkpoint/record_checkpointer.hpp"
#include "internal/config/consumer_settings.hpp"
#include "internal/model/shard_status.hpp"
#include "internal/processor/record_processor.hpp"
#include "internal/stream/stream_client.hpp"
#include "internal/util/time.hpp"
#include "shardfeed/v1/stream.pb.h"

namespace shardfeed::consumer {

enum class RunOutcome {
  // Shard closed and fully read.
  kShardClosed,
  kStopRequested,
  // Another worker took the lease.
  kLeaseLost,
};

/*
  Polls a single shard from lease acquisition until the run ends.

  Precondition: the caller holds the lease on the shard. The lease is
  released exactly once when Run() returns or throws, after the processor
  has been told about the shutdown.

  Run() returns on shard closure, stop request or lease loss. Fatal stream
  errors, exhausted retries and store failures are thrown as util::StreamFailure,
  util::RetriesExhausted or util::CheckpointFailure.
*/
class PollingShardConsumer {
 public:
  PollingShardConsumer(config::ConsumerSettings                   settings,
                       std::shared_ptr<model::ShardStatus>        shard,
                       std::shared_ptr<stream::StreamClient>      client,
                       std::shared_ptr<checkpoint::Checkpointer>  checkpointer,
                       std::shared_ptr<processor::RecordProcessor> processor,
                       util::Clock&                               clock = util::DefaultClock());

  RunOutcome Run();

  // Safe to call from any thread. Observed between fetch cycles.
  void RequestStop();

  bool StopRequested() const {
    return stop_requested_.load();
  }

 private:
  // False if a stop was requested while waiting.
  bool WaitOnParentShard();

  shardfeed::v1::StartingPosition ResolveStartingPosition();

  std::string GetShardIterator(const shardfeed::v1::StartingPosition& position);

  // False if the lease was lost to another owner.
  bool RefreshLeaseIfDue();

  void DeliverRecords(util::TimePoint fetch_started, shardfeed::v1::GetRecordsResponse& response,
                      checkpoint::RecordProcessorCheckpointer& checkpointer);

  void NotifyShutdown(processor::ShutdownReason reason, checkpoint::RecordProcessorCheckpointer& checkpointer);

  const config::ConsumerSettings              settings_;
  std::shared_ptr<model::ShardStatus>         shard_;
  std::shared_ptr<stream::StreamClient>       client_;
  std::shared_ptr<checkpoint::Checkpointer>   checkpointer_;
  std::shared_ptr<processor::RecordProcessor> processor_;
  util::Clock&                                clock_;

  std::atomic<bool> stop_requested_{false};
};

} // namespace shardfeed::consumer
