#include "polling_shard_consumer.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/throttle/rate_limiter.hpp"
#include "internal/util/errors.hpp"

namespace shardfeed::consumer {

using namespace shardfeed::v1;
using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

uint64_t PayloadBytes(const GetRecordsResponse& response) {
  uint64_t bytes = 0;
  for (const auto& record : response.records()) {
    bytes += record.data().size();
  }
  return bytes;
}

/*
  Releases the shard lease when a run ends, however it ends.
*/
class LeaseReleaser {
 public:
  LeaseReleaser(model::ShardStatus& shard, checkpoint::Checkpointer& checkpointer, const std::string& owner)
      : shard_(shard), checkpointer_(checkpointer), owner_(owner) {
  }

  LeaseReleaser(const LeaseReleaser&)            = delete;
  LeaseReleaser& operator=(const LeaseReleaser&) = delete;

  ~LeaseReleaser() {
    try {
      SHARDFEED_LOG_INFO("Releasing lease");
      shard_.SetLeaseOwner("");
      // an unreleased lease still expires on its own
      auto result = checkpointer_.RemoveLeaseOwner(shard_.Id(), owner_);
      if (result.code == checkpoint::ErrorCode::LeaseNotAcquired) {
        SHARDFEED_LOG_INFO("Lease already held by another owner", {StringField("error", result.message)});
      } else if (!result) {
        SHARDFEED_LOG_ERROR("Failed to release lease", {StringField("error", result.message)});
      }
    } catch (const std::exception& e) {
      SHARDFEED_LOG_ERROR("Failed to release lease", {StringField("error", e.what())});
    }
  }

 private:
  model::ShardStatus&       shard_;
  checkpoint::Checkpointer& checkpointer_;
  const std::string&        owner_;
};

} // namespace

PollingShardConsumer::PollingShardConsumer(config::ConsumerSettings                    settings,
                                           std::shared_ptr<model::ShardStatus>         shard,
                                           std::shared_ptr<stream::StreamClient>       client,
                                           std::shared_ptr<checkpoint::Checkpointer>   checkpointer,
                                           std::shared_ptr<processor::RecordProcessor> processor,
                                           util::Clock&                                clock)
    : settings_(std::move(settings)),
      shard_(std::move(shard)),
      client_(std::move(client)),
      checkpointer_(std::move(checkpointer)),
      processor_(std::move(processor)),
      clock_(clock) {
  if (!shard_ || !client_ || !checkpointer_ || !processor_) {
    throw std::invalid_argument("PollingShardConsumer requires shard, client, checkpointer and processor");
  }
}

void PollingShardConsumer::RequestStop() {
  stop_requested_.store(true);
}

bool PollingShardConsumer::WaitOnParentShard() {
  if (shard_->ParentShardId().empty()) {
    return true;
  }

  model::ShardStatus parent(shard_->ParentShardId());
  while (true) {
    auto result = checkpointer_->FetchCheckpoint(parent);
    if (result.code == checkpoint::ErrorCode::NotFound) {
      // parent already retired and its lease record cleaned up
      SHARDFEED_LOG_DEBUG("Parent shard has no checkpoint, not waiting", {StringField("parent_shard_id", parent.Id())});
      return true;
    }
    if (!result) {
      SHARDFEED_LOG_ERROR("Error waiting for parent shard to finish",
                          {StringField("parent_shard_id", parent.Id()), StringField("error", result.message)});
      throw util::CheckpointFailure("wait on parent shard " + parent.Id() + ": " + result.message);
    }
    if (parent.GetCheckpoint() == model::kShardEnd) {
      return true;
    }
    if (StopRequested()) {
      return false;
    }
    clock_.SleepFor(settings_.parent_shard_poll_interval);
  }
}

StartingPosition PollingShardConsumer::ResolveStartingPosition() {
  auto result = checkpointer_->FetchCheckpoint(*shard_);
  if (!result && result.code != checkpoint::ErrorCode::NotFound) {
    throw util::CheckpointFailure("fetch checkpoint for shard " + shard_->Id() + ": " + result.message);
  }

  StartingPosition position;
  const auto       checkpoint = shard_->GetCheckpoint();
  if (!checkpoint.empty()) {
    SHARDFEED_LOG_DEBUG("Starting shard at checkpoint", {StringField("checkpoint", checkpoint)});
    position.set_type(AFTER_SEQUENCE_NUMBER);
    position.set_sequence_number(checkpoint);
    return position;
  }

  SHARDFEED_LOG_DEBUG("No checkpoint recorded for shard, using initial position",
                      {StringField("initial_position", ShardIteratorType_Name(settings_.initial_position))});
  position.set_type(settings_.initial_position);
  if (settings_.initial_position == AT_TIMESTAMP && settings_.initial_timestamp.has_value()) {
    *position.mutable_timestamp() = util::ToProto(*settings_.initial_timestamp);
  }
  return position;
}

std::string PollingShardConsumer::GetShardIterator(const StartingPosition& position) {
  GetShardIteratorRequest request;
  request.set_stream_name(settings_.stream_name);
  request.set_shard_id(shard_->Id());
  *request.mutable_starting_position() = position;

  GetShardIteratorResponse response;
  auto                     result = client_->GetShardIterator(request, &response);
  if (!result) {
    SHARDFEED_LOG_ERROR("Unable to get shard iterator", {StringField("error", result.message)});
    throw util::StreamFailure("get shard iterator for " + shard_->Id() + ": " + std::string(stream::ToString(result.code)) + ": " +
                              result.message);
  }
  return response.shard_iterator();
}

bool PollingShardConsumer::RefreshLeaseIfDue() {
  if (clock_.Now() <= shard_->GetLeaseTimeout() - settings_.lease_refresh_period) {
    return true;
  }

  SHARDFEED_LOG_DEBUG("Refreshing lease", {DurationField("remaining", shard_->GetLeaseTimeout() - clock_.Now())});
  auto result = checkpointer_->GetLease(*shard_, settings_.worker_id);
  if (result) {
    return true;
  }
  if (result.code == checkpoint::ErrorCode::LeaseNotAcquired) {
    SHARDFEED_LOG_WARN("Lost lease on shard", {StringField("error", result.message)});
    return false;
  }

  SHARDFEED_LOG_ERROR("Error refreshing lease", {StringField("error", result.message)});
  throw util::CheckpointFailure("refresh lease on shard " + shard_->Id() + ": " + result.message);
}

void PollingShardConsumer::DeliverRecords(util::TimePoint fetch_started, GetRecordsResponse& response,
                                          checkpoint::RecordProcessorCheckpointer& checkpointer) {
  SHARDFEED_LOG_DEBUG("Received records",
                      {IntField("count", response.records_size()), IntField("millis_behind_latest", response.millis_behind_latest())});

  if (response.records().empty() && !settings_.call_process_records_even_for_empty_list) {
    return;
  }

  processor::ProcessRecordsInput input;
  input.records.Swap(response.mutable_records());
  input.millis_behind_latest = response.millis_behind_latest();
  input.checkpointer         = &checkpointer;
  input.cache_entry_time     = fetch_started;
  input.cache_exit_time      = clock_.Now();

  processor_->ProcessRecords(input);
}

void PollingShardConsumer::NotifyShutdown(processor::ShutdownReason reason, checkpoint::RecordProcessorCheckpointer& checkpointer) {
  processor::ShutdownInput input;
  input.reason       = reason;
  input.checkpointer = &checkpointer;
  processor_->Shutdown(input);
}

RunOutcome PollingShardConsumer::Run() {
  // outlives the releaser so its log lines carry the shard too
  observability::ScopedLogContext log_context({StringField("shard_id", shard_->Id()), StringField("worker_id", settings_.worker_id)});
  LeaseReleaser                   releaser(*shard_, *checkpointer_, settings_.worker_id);

  if (!WaitOnParentShard()) {
    SHARDFEED_LOG_INFO("Stop requested while waiting on parent shard");
    return RunOutcome::kStopRequested;
  }

  const auto                              position = ResolveStartingPosition();
  checkpoint::RecordProcessorCheckpointer record_checkpointer(*shard_, *checkpointer_);

  processor::InitializationInput init;
  init.shard_id   = shard_->Id();
  init.checkpoint = shard_->GetCheckpoint();

  if (init.checkpoint == model::kShardEnd) {
    SHARDFEED_LOG_INFO("Shard already fully processed");
    processor_->Initialize(init);
    NotifyShutdown(processor::ShutdownReason::kTerminate, record_checkpointer);
    return RunOutcome::kShardClosed;
  }

  std::string shard_iterator = GetShardIterator(position);
  processor_->Initialize(init);

  throttle::RateLimiter    limiter(settings_.throughput, clock_);
  const retry::RetryPolicy retry_policy(settings_.max_retry_count);
  retry::RetryState        retry_state;

  while (true) {
    if (!RefreshLeaseIfDue()) {
      NotifyShutdown(processor::ShutdownReason::kLeaseLost, record_checkpointer);
      return RunOutcome::kLeaseLost;
    }

    if (limiter.Acquire() == throttle::Admission::kLocalTpsExceeded) {
      SHARDFEED_LOG_DEBUG("Local read call budget spent, waiting for next window");
      limiter.WaitForNextWindow();
      continue;
    }

    GetRecordsRequest request;
    request.set_shard_iterator(shard_iterator);
    request.set_limit(static_cast<int32_t>(settings_.max_records));

    SHARDFEED_LOG_DEBUG("Reading records", {IntField("limit", request.limit())});
    const auto         fetch_started = clock_.Now();
    GetRecordsResponse response;
    auto               result = client_->GetRecords(request, &response);
    limiter.RecordCall();

    if (!result) {
      const auto decision = retry_policy.OnFailure(retry_state, result.code, clock_.Since(fetch_started));
      switch (decision.action) {
        case retry::RetryAction::kRetry:
          SHARDFEED_LOG_INFO("Throttled reading shard, retrying",
                             {StringField("error", stream::ToString(result.code)), IntField("retry_count", retry_state.consecutive_failures),
                              DurationField("delay", decision.delay)});
          clock_.SleepFor(decision.delay);
          continue;

        case retry::RetryAction::kExhausted:
          SHARDFEED_LOG_ERROR("Reached max retry count getting records",
                              {StringField("error", stream::ToString(result.code)), IntField("retry_count", retry_state.consecutive_failures)});
          throw util::RetriesExhausted("get records from shard " + shard_->Id() + ": " + std::string(stream::ToString(result.code)) +
                                       ": " + result.message);

        case retry::RetryAction::kFatal:
          SHARDFEED_LOG_ERROR("Error getting records that cannot be retried",
                              {StringField("error", stream::ToString(result.code)), StringField("message", result.message)});
          throw util::StreamFailure("get records from shard " + shard_->Id() + ": " + std::string(stream::ToString(result.code)) +
                                    ": " + result.message);
      }
    }

    retry_policy.OnSuccess(retry_state);
    limiter.RecordBytes(PayloadBytes(response));

    const bool  caught_up     = response.records().empty() && response.millis_behind_latest() < settings_.idle_time_between_reads.count();
    const bool  shard_closed  = !response.has_next_shard_iterator();
    std::string next_iterator = shard_closed ? std::string() : response.next_shard_iterator();

    DeliverRecords(fetch_started, response, record_checkpointer);

    if (shard_closed) {
      SHARDFEED_LOG_INFO("Shard closed");
      NotifyShutdown(processor::ShutdownReason::kTerminate, record_checkpointer);
      return RunOutcome::kShardClosed;
    }
    shard_iterator = std::move(next_iterator);

    // idle only when caught up; any records mean read again right away
    if (caught_up) {
      clock_.SleepFor(settings_.idle_time_between_reads);
    }

    if (StopRequested()) {
      SHARDFEED_LOG_INFO("Shutdown requested");
      NotifyShutdown(processor::ShutdownReason::kRequested, record_checkpointer);
      return RunOutcome::kStopRequested;
    }
  }
}

} // namespace shardfeed::consumer
