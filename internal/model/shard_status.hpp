#pragma once

#include <shared_mutex>
#include <string>

#include "internal/util/time.hpp"

namespace shardfeed::model {

// Checkpoint value recorded once a closed shard has been fully processed.
inline constexpr const char* kShardEnd = "SHARD_END";

/*
  Live view of one shard's lease and progress.

  Shared between the owning worker and its PollingShardConsumer, so all
  mutable fields are guarded. Durable state lives in the Checkpointer.
*/
class ShardStatus {
 public:
  ShardStatus(std::string id, std::string parent_shard_id = {});

  ShardStatus(const ShardStatus&)            = delete;
  ShardStatus& operator=(const ShardStatus&) = delete;

  const std::string& Id() const {
    return id_;
  }
  const std::string& ParentShardId() const {
    return parent_shard_id_;
  }

  std::string GetCheckpoint() const;
  void        SetCheckpoint(std::string checkpoint);

  std::string GetLeaseOwner() const;
  void        SetLeaseOwner(std::string owner);

  util::TimePoint GetLeaseTimeout() const;
  void            SetLeaseTimeout(util::TimePoint timeout);

 private:
  const std::string id_;
  const std::string parent_shard_id_;

  mutable std::shared_mutex mutex_;
  std::string               checkpoint_;
  std::string               lease_owner_;
  util::TimePoint           lease_timeout_{};
};

} // namespace shardfeed::model
