#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/util/time.hpp"
#include "shardfeed/v1/stream.pb.h"

namespace shardfeed::config {

/*
  Resolved per-shard consumer settings.

  Built once from RuntimeConfig; zero/unset config values take the
  defaults below.
*/
struct ThroughputLimits {
  uint32_t max_calls_per_second = 5;
  uint64_t max_bytes_per_second = 2'000'000;
  uint64_t max_bytes_per_window = 10'000'000;
};

struct ConsumerSettings {
  std::string stream_name;
  std::string worker_id;

  uint32_t max_records     = 10000;
  uint32_t max_retry_count = 5;

  std::chrono::milliseconds idle_time_between_reads{1000};
  std::chrono::milliseconds lease_refresh_period{5000};
  std::chrono::milliseconds lease_duration{10000};
  std::chrono::milliseconds parent_shard_poll_interval{10000};

  // LATEST, TRIM_HORIZON or AT_TIMESTAMP
  shardfeed::v1::ShardIteratorType initial_position = shardfeed::v1::LATEST;
  std::optional<util::TimePoint>   initial_timestamp;

  bool call_process_records_even_for_empty_list = false;

  ThroughputLimits throughput;

  static ConsumerSettings FromConfig(const shardfeed::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig.
  void Validate() const;
};

} // namespace shardfeed::config
