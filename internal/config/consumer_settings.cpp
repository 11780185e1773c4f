#include "consumer_settings.hpp"

#include <string>

#include <google/protobuf/util/time_util.h>

#include "internal/retry/retry_policy.hpp"
#include "internal/util/errors.hpp"

namespace shardfeed::config {

namespace {

using google::protobuf::util::TimeUtil;

void ApplyDuration(bool has_value, const google::protobuf::Duration& value, std::chrono::milliseconds* target) {
  if (!has_value) return;
  *target = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(value));
}

shardfeed::v1::ShardIteratorType ToIteratorType(shardfeed::runtime::config::InitialPosition position) {
  switch (position) {
    case shardfeed::runtime::config::TRIM_HORIZON:
      return shardfeed::v1::TRIM_HORIZON;
    case shardfeed::runtime::config::AT_TIMESTAMP:
      return shardfeed::v1::AT_TIMESTAMP;
    case shardfeed::runtime::config::LATEST:
    case shardfeed::runtime::config::INITIAL_POSITION_UNSPECIFIED:
    default:
      return shardfeed::v1::LATEST;
  }
}

} // namespace

ConsumerSettings ConsumerSettings::FromConfig(const shardfeed::runtime::config::RuntimeConfig& config) {
  ConsumerSettings settings;

  const auto& consumer = config.consumer();
  settings.stream_name = consumer.stream_name();
  settings.worker_id   = consumer.worker_id();

  if (consumer.max_records() != 0) settings.max_records = consumer.max_records();
  if (consumer.has_max_retry_count()) settings.max_retry_count = consumer.max_retry_count();

  ApplyDuration(consumer.has_idle_time_between_reads(), consumer.idle_time_between_reads(), &settings.idle_time_between_reads);
  ApplyDuration(consumer.has_lease_refresh_period(), consumer.lease_refresh_period(), &settings.lease_refresh_period);
  ApplyDuration(consumer.has_lease_duration(), consumer.lease_duration(), &settings.lease_duration);
  ApplyDuration(consumer.has_parent_shard_poll_interval(), consumer.parent_shard_poll_interval(),
                &settings.parent_shard_poll_interval);

  settings.initial_position = ToIteratorType(consumer.initial_position());
  if (consumer.has_initial_timestamp()) {
    settings.initial_timestamp = util::FromProto(consumer.initial_timestamp());
  }

  settings.call_process_records_even_for_empty_list = consumer.call_process_records_even_for_empty_list();

  const auto& throughput = config.throughput();
  if (throughput.max_calls_per_second() != 0) settings.throughput.max_calls_per_second = throughput.max_calls_per_second();
  if (throughput.max_bytes_per_second() != 0) settings.throughput.max_bytes_per_second = throughput.max_bytes_per_second();
  if (throughput.max_bytes_per_window() != 0) settings.throughput.max_bytes_per_window = throughput.max_bytes_per_window();

  settings.Validate();
  return settings;
}

void ConsumerSettings::Validate() const {
  if (stream_name.empty()) {
    throw util::InvalidConfig("consumer.stream_name must be set");
  }
  if (worker_id.empty()) {
    throw util::InvalidConfig("consumer.worker_id must be set");
  }
  if (max_records == 0 || max_records > 10000) {
    throw util::InvalidConfig("consumer.max_records must be in [1, 10000]");
  }
  if (max_retry_count > retry::RetryPolicy::kMaxBackoffExponent) {
    throw util::InvalidConfig("consumer.max_retry_count must be at most " + std::to_string(retry::RetryPolicy::kMaxBackoffExponent));
  }
  if (idle_time_between_reads.count() < 0 || lease_refresh_period.count() < 0 || parent_shard_poll_interval.count() < 0) {
    throw util::InvalidConfig("consumer durations must not be negative");
  }
  if (lease_duration <= lease_refresh_period) {
    throw util::InvalidConfig("consumer.lease_duration must exceed consumer.lease_refresh_period");
  }
  if (initial_position == shardfeed::v1::AT_TIMESTAMP && !initial_timestamp.has_value()) {
    throw util::InvalidConfig("consumer.initial_timestamp is required for AT_TIMESTAMP");
  }
  if (throughput.max_calls_per_second == 0 || throughput.max_bytes_per_second == 0) {
    throw util::InvalidConfig("throughput limits must be positive");
  }
  if (throughput.max_bytes_per_window < throughput.max_bytes_per_second) {
    throw util::InvalidConfig("throughput.max_bytes_per_window must be at least max_bytes_per_second");
  }
}

} // namespace shardfeed::config
